//! # Build Environment
//!
//! Snapshot of every environment variable a build consumes. The snapshot is
//! taken once by `BuildEnv::from_process()` and handed to the components;
//! nothing else in the library reads the process environment.
//!
//! | Variable                  | Field           | Use                                   |
//! |---------------------------|-----------------|---------------------------------------|
//! | `PATH`                    | `path`          | Executable search                     |
//! | `SIMDBUILD_COMPILER`      | `compiler`      | SIMD compiler (default `ispc`)        |
//! | `SIMDBUILD_BINDGEN`       | `bindgen`       | Declaration extractor (default `clang`) |
//! | `LIBCLANG_PATH`           | `libclang_path` | Searched before `PATH` for the extractor |
//! | `AR`                      | `ar`            | Archiver override                     |
//! | `CC`                      | `cc`            | Shared library link driver override   |
//! | `OUT_DIR`                 | `out_dir`       | Default output directory              |
//! | `OPT_LEVEL`               | `opt_level`     | Default optimization level            |
//! | `DEBUG`                   | `debug`         | Default debug-info flag               |
//! | `TARGET`                  | `target`        | Default target triple                 |
//! | `HOST`                    | `host`          | Host triple                           |
//! | `SIMDBUILD_PREBUILT_PATH` | `prebuilt_path` | Extra directories for the locator     |
//! | `SIMDBUILD_LOG`           | `log_spec`      | Logger level or filter                |

#ifndef SIMDBUILD_BUILD_BUILD_ENV_HPP
#define SIMDBUILD_BUILD_BUILD_ENV_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

struct BuildEnv {
    std::string path;
    std::string compiler = "ispc";
    std::string bindgen = "clang";
    std::string libclang_path;
    std::string ar;
    std::string cc;
    fs::path out_dir;
    std::string opt_level;
    std::string debug;
    std::string target;
    std::string host;
    std::string prebuilt_path;
    std::string log_spec;
    fs::path cwd;

    /// Reads the process environment and working directory.
    static BuildEnv from_process();

    /// `PATH` split into directories.
    [[nodiscard]] std::vector<fs::path> search_path() const;

    /// Search path for the declaration extractor: `LIBCLANG_PATH` first.
    [[nodiscard]] std::vector<fs::path> bindgen_search_path() const;

    /// `OPT_LEVEL` as a number. Cargo's size levels "s" and "z" map to 2.
    [[nodiscard]] std::optional<int> default_opt_level() const;

    /// `DEBUG` is "true" or "1".
    [[nodiscard]] bool default_debug() const;

    /// Resolves `p` against `cwd` when relative.
    [[nodiscard]] fs::path absolute(const fs::path& p) const;
};

/// Splits a PATH-style list on the platform separator, dropping empty entries.
[[nodiscard]] std::vector<fs::path> split_path_list(const std::string& list);

/// Configures the global logger from `env.log_spec`.
///
/// Called by `BuildConfig::compile()`. Does nothing when the spec is empty
/// or is the one applied last, so sinks added after the first call survive
/// later builds. Returns true if the logger was reconfigured.
bool init_logging(const BuildEnv& env);

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_BUILD_ENV_HPP
