//! # Host CPU Detection
//!
//! Detects which target ISAs the running machine can execute. Detection
//! runs once per process; every later call returns the memoized answer.
//! The multi-target dispatch stub makes the same decision at run time, so
//! `select_isa()` tells the build log which specialization this machine
//! would execute.

#ifndef SIMDBUILD_TARGET_HOST_CPU_HPP
#define SIMDBUILD_TARGET_HOST_CPU_HPP

#include "simdbuild/target/target_isa.hpp"

#include <optional>
#include <span>

namespace simdbuild::target {

/// Instruction set extensions available on the host.
struct CpuFeatures {
    bool sse2 = false;
    bool sse4 = false;
    bool avx = false;
    bool avx2 = false;
    bool avx512knl = false;
    bool avx512skx = false;
    bool neon = false;

    /// True if code compiled for `isa` runs on a CPU with these features.
    [[nodiscard]] bool supports(TargetIsa isa) const;
};

/// Features of the machine running this process (memoized).
[[nodiscard]] auto host_cpu_features() -> const CpuFeatures&;

/// Picks the most capable target from `requested` that `features` supports.
///
/// Candidates are ranked by enumeration order, later targets being the more
/// capable ones. `Host` always matches. Returns nullopt if nothing fits.
[[nodiscard]] auto select_isa(std::span<const TargetIsa> requested, const CpuFeatures& features)
    -> std::optional<TargetIsa>;

/// `select_isa()` against the host features.
[[nodiscard]] auto select_isa(std::span<const TargetIsa> requested) -> std::optional<TargetIsa>;

} // namespace simdbuild::target

#endif // SIMDBUILD_TARGET_HOST_CPU_HPP
