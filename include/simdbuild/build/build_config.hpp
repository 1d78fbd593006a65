//! # Build Configuration
//!
//! The builder a host project's build step drives: it collects sources,
//! targets and compiler options, then `compile()` runs the whole pipeline.
//!
//! ## Example
//!
//! ```cpp
//! auto env = BuildEnv::from_process();
//! BuildConfig config(env);
//! config.file("src/kernels.ispc")
//!     .target_isas({TargetIsa::Sse2I32x4, TargetIsa::Avx2I32x8})
//!     .opt_level(3);
//! auto result = config.compile("kernels");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```
//!
//! ## Pipeline
//!
//! | Step | Failure                  |
//! |------|--------------------------|
//! | Validate options and library name | Configuration |
//! | Resolve the compiler, query `--version` | ToolNotFound / Configuration |
//! | Classify sources against their dependency records | |
//! | Compile stale sources | CompilationFailure |
//! | Archive every object | LinkFailure |
//! | Generate bindings | BindingGeneration |
//! | Report link directives | |
//!
//! Setters validate eagerly; the first problem is kept and returned by
//! `validate()` and `compile()`. Nothing is written before validation and
//! tool resolution succeed.

#ifndef SIMDBUILD_BUILD_BUILD_CONFIG_HPP
#define SIMDBUILD_BUILD_BUILD_CONFIG_HPP

#include "simdbuild/bindings/binding_bridge.hpp"
#include "simdbuild/build/archiver.hpp"
#include "simdbuild/build/build_env.hpp"
#include "simdbuild/build/build_error.hpp"
#include "simdbuild/build/compile_unit.hpp"
#include "simdbuild/build/link_directives.hpp"
#include "simdbuild/target/target_isa.hpp"

#include <compare>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

using target::Addressing;
using target::Architecture;
using target::Cpu;
using target::MathLib;
using target::OptimizationOpt;
using target::TargetIsa;
using target::TargetOs;

/// A `-D` define; `value` empty means `-DNAME`.
struct Define {
    std::string name;
    std::optional<std::string> value;
};

/// Compiler release, as reported by `--version`.
struct CompilerVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    auto operator<=>(const CompilerVersion&) const = default;

    [[nodiscard]] auto to_string() const -> std::string;
};

/// Extracts the version from `--version` output.
[[nodiscard]] auto parse_compiler_version(std::string_view output)
    -> std::optional<CompilerVersion>;

/// Oldest compiler that supports `--instrument`.
constexpr CompilerVersion INSTRUMENT_MIN_VERSION{1, 9, 1};
/// Oldest compiler that supports `--opt=disable-zmm`.
constexpr CompilerVersion DISABLE_ZMM_MIN_VERSION{1, 13, 0};

/// True for `[A-Za-z_][A-Za-z0-9_]*`.
[[nodiscard]] bool is_identifier(std::string_view name);

struct BuildStats {
    size_t units_total = 0;
    size_t sources_compiled = 0;
    size_t sources_reused = 0;
    int64_t elapsed_ms = 0;
};

struct BuildOutput {
    Library library;
    bindings::BindingModule bindings;
    std::vector<CompileUnit> units;
    BuildStats stats;
    LinkDirectives directives;
    CompilerVersion compiler_version;
};

class BuildConfig {
public:
    explicit BuildConfig(BuildEnv env);

    // ========================================================================
    // Sources and Outputs
    // ========================================================================

    auto file(const fs::path& source) -> BuildConfig&;
    auto files(const std::vector<fs::path>& sources) -> BuildConfig&;
    auto out_dir(const fs::path& dir) -> BuildConfig&;
    auto library_kind(LibraryKind kind) -> BuildConfig&;
    /// Enables printing of `cargo:` metadata after a successful compile.
    auto cargo_metadata(bool enabled) -> BuildConfig&;
    /// Concurrent compiler processes; 0 uses the hardware concurrency.
    auto jobs(size_t count) -> BuildConfig&;

    // ========================================================================
    // Code Generation
    // ========================================================================

    auto debug(bool enabled) -> BuildConfig&;
    auto opt_level(int level) -> BuildConfig&;
    auto target(const std::string& triple) -> BuildConfig&;
    auto target_isa(TargetIsa isa) -> BuildConfig&;
    auto target_isas(const std::vector<TargetIsa>& isas) -> BuildConfig&;
    auto math_lib(MathLib lib) -> BuildConfig&;
    auto addressing(Addressing addressing) -> BuildConfig&;
    auto architecture(Architecture arch) -> BuildConfig&;
    auto cpu(Cpu cpu) -> BuildConfig&;
    auto target_os(TargetOs os) -> BuildConfig&;
    auto optimization_opt(OptimizationOpt opt) -> BuildConfig&;
    auto force_alignment(uint32_t alignment) -> BuildConfig&;
    auto pic(bool enabled) -> BuildConfig&;

    // ========================================================================
    // Preprocessor and Diagnostics
    // ========================================================================

    auto add_define(const std::string& name, std::optional<std::string> value = std::nullopt)
        -> BuildConfig&;
    auto include_path(const fs::path& dir) -> BuildConfig&;
    auto no_omit_frame_pointer() -> BuildConfig&;
    auto no_stdlib() -> BuildConfig&;
    auto no_cpp() -> BuildConfig&;
    auto quiet() -> BuildConfig&;
    auto werror() -> BuildConfig&;
    auto woff() -> BuildConfig&;
    auto wno_perf() -> BuildConfig&;
    auto instrument() -> BuildConfig&;
    /// Raw flag appended after every generated one.
    auto extra_flag(const std::string& flag) -> BuildConfig&;

    // ========================================================================
    // Resolved Settings
    // ========================================================================

    [[nodiscard]] const std::vector<fs::path>& sources() const {
        return sources_;
    }
    [[nodiscard]] const std::vector<TargetIsa>& isas() const {
        return isas_;
    }
    [[nodiscard]] const BuildEnv& env() const {
        return env_;
    }
    /// Explicit level, else `OPT_LEVEL`, else 2.
    [[nodiscard]] int effective_opt_level() const;
    /// Explicit flag, else `DEBUG`.
    [[nodiscard]] bool effective_debug() const;
    /// Explicit triple, else `TARGET`, else the host triple.
    [[nodiscard]] std::string effective_triple() const;
    /// Explicit directory, else `OUT_DIR`; absolute, empty if neither is set.
    [[nodiscard]] fs::path effective_out_dir() const;
    /// Explicit setting, else on for every non-Windows triple.
    [[nodiscard]] bool effective_pic() const;
    [[nodiscard]] size_t effective_jobs() const;

    /// First configuration problem, if any.
    [[nodiscard]] auto validate() const -> MaybeError;

    /// Arguments shared by every source, in compiler order.
    [[nodiscard]] auto compiler_arguments() const -> std::vector<std::string>;

    /// Runs the pipeline and produces the library `name`.
    [[nodiscard]] auto compile(const std::string& name) -> BuildResult<BuildOutput>;

private:
    BuildEnv env_;
    MaybeError error_;

    std::vector<fs::path> sources_;
    std::set<std::string> stems_;
    std::vector<TargetIsa> isas_;
    fs::path out_dir_;
    LibraryKind library_kind_ = LibraryKind::Static;
    bool cargo_metadata_ = false;
    size_t jobs_ = 1;

    std::optional<bool> debug_;
    std::optional<int> opt_level_;
    std::string target_;
    MathLib math_lib_ = MathLib::Default;
    std::optional<Addressing> addressing_;
    std::optional<Architecture> architecture_;
    std::optional<Cpu> cpu_;
    std::optional<TargetOs> target_os_;
    std::vector<OptimizationOpt> optimization_opts_;
    std::optional<uint32_t> force_alignment_;
    std::optional<bool> pic_;

    std::vector<Define> defines_;
    std::vector<fs::path> include_paths_;
    bool no_omit_frame_pointer_ = false;
    bool no_stdlib_ = false;
    bool no_cpp_ = false;
    bool quiet_ = false;
    bool werror_ = false;
    bool woff_ = false;
    bool wno_perf_ = false;
    bool instrument_ = false;
    std::vector<std::string> extra_flags_;

    void fail(std::string message);
    auto query_version(const fs::path& compiler) const -> BuildResult<CompilerVersion>;
    auto check_version(const CompilerVersion& version) const -> MaybeError;
};

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_BUILD_CONFIG_HPP
