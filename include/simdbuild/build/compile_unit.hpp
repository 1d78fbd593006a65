//! # Compile Units
//!
//! Expansion of (sources × target ISAs) into the files one build produces.
//!
//! ## Output Layout
//!
//! For a source `dir/kernel.ispc` in output directory `out`:
//!
//! | File                          | Produced by          |
//! |-------------------------------|----------------------|
//! | `out/kernel_ispc.o`           | compiler (single ISA object or dispatch stub) |
//! | `out/kernel_ispc_<suffix>.o`  | compiler, one per ISA when more than one ISA |
//! | `out/kernel_ispc.h`           | compiler (`-h`)      |
//! | `out/kernel_ispc.idep`        | compiler (`-MMM`)    |
//! | `out/kernel_ispc.deprec`      | dependency tracker   |

#ifndef SIMDBUILD_BUILD_COMPILE_UNIT_HPP
#define SIMDBUILD_BUILD_COMPILE_UNIT_HPP

#include "simdbuild/build/build_error.hpp"
#include "simdbuild/target/target_isa.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace simdbuild::build {

using target::TargetIsa;

/// One object file the compiler produces for a source.
///
/// `isa` is nullopt for the dispatch stub of a multi-target build.
struct CompileUnit {
    fs::path source;
    std::optional<TargetIsa> isa;
    fs::path object;

    [[nodiscard]] bool is_dispatch() const {
        return !isa.has_value();
    }
};

/// A produced object with its modification time, as handed to the archiver.
struct GeneratedArtifact {
    fs::path object;
    std::optional<TargetIsa> isa; ///< nullopt for the dispatch stub
    int64_t mtime_ns = 0;
};

/// Everything one compiler invocation reads and writes.
struct SourcePlan {
    fs::path source;
    std::string stem;
    fs::path header;
    fs::path dep_file;
    fs::path record;
    /// Dispatch stub first (multi-target only), then ISAs in enumeration order.
    std::vector<CompileUnit> units;

    /// The path passed to `-o`.
    [[nodiscard]] const fs::path& primary_object() const {
        return units.front().object;
    }

    /// Objects and header the compiler must have produced on success. The
    /// dependency file is optional.
    [[nodiscard]] std::vector<fs::path> expected_outputs() const;
};

/// Base name shared by every output of `stem`, e.g. "kernel_ispc".
[[nodiscard]] auto output_base(const std::string& stem) -> std::string;

/// Expands sources × ISAs into per-source plans.
///
/// `isas` must already be validated (deduplicated, `Host` alone). An empty
/// list is treated as `{Host}`.
[[nodiscard]] auto plan_sources(const std::vector<fs::path>& sources,
                                std::span<const TargetIsa> isas, const fs::path& out_dir)
    -> std::vector<SourcePlan>;

/// Stats every unit object in archive order. A missing object is a
/// LinkFailure, so no archive is built from a partial set.
[[nodiscard]] auto collect_artifacts(const std::vector<SourcePlan>& plans)
    -> BuildResult<std::vector<GeneratedArtifact>>;

} // namespace simdbuild::build

#endif // SIMDBUILD_BUILD_COMPILE_UNIT_HPP
