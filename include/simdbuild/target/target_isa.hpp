//! # Target Catalog
//!
//! The instruction-set targets and the other code generation options the
//! SIMD compiler understands, with their command line spellings.
//!
//! ## Target ISAs
//!
//! | Family    | Widths                          | Object suffix |
//! |-----------|---------------------------------|---------------|
//! | SSE2      | i32x4, i32x8                    | `sse2`        |
//! | SSE4      | i32x4, i32x8, i16x8, i8x16      | `sse4`        |
//! | AVX1      | i32x4, i32x8, i32x16, i64x4     | `avx`         |
//! | AVX2      | i32x8, i32x16, i64x4            | `avx2`        |
//! | AVX-512   | knl-i32x16, skx-i32x16/i32x8    | `avx512knl`, `avx512skx` |
//! | NEON      | i8x16, i16x8, i32x4, i32x8      | `neon`        |
//!
//! `Host` lets the compiler pick the ISA of the machine it runs on and can
//! not be combined with other targets.
//!
//! The declaration order of `TargetIsa` is the enumeration order used to
//! order objects inside an archive.

#ifndef SIMDBUILD_TARGET_TARGET_ISA_HPP
#define SIMDBUILD_TARGET_TARGET_ISA_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace simdbuild::target {

// ============================================================================
// Target ISA
// ============================================================================

/// An instruction set and vector width the compiler can specialize for.
enum class TargetIsa : uint8_t {
    Host,
    Sse2I32x4,
    Sse2I32x8,
    Sse4I32x4,
    Sse4I32x8,
    Sse4I16x8,
    Sse4I8x16,
    Avx1I32x4,
    Avx1I32x8,
    Avx1I32x16,
    Avx1I64x4,
    Avx2I32x8,
    Avx2I32x16,
    Avx2I64x4,
    Avx512KnlI32x16,
    Avx512SkxI32x16,
    Avx512SkxI32x8,
    NeonI8x16,
    NeonI16x8,
    NeonI32x4,
    NeonI32x8,
};

/// Every target in enumeration order.
[[nodiscard]] auto all_isas() -> std::span<const TargetIsa>;

/// Compiler spelling, e.g. "avx2-i32x8". Used in `--target=`.
[[nodiscard]] auto isa_flag(TargetIsa isa) -> std::string_view;

/// Suffix the compiler appends to per-ISA object files, e.g. "avx2".
[[nodiscard]] auto isa_suffix(TargetIsa isa) -> std::string_view;

/// Parses a compiler spelling back into a TargetIsa.
[[nodiscard]] auto parse_isa(std::string_view flag) -> std::optional<TargetIsa>;

/// Joins the flag spellings with commas, in the given order.
[[nodiscard]] auto join_isa_flags(std::span<const TargetIsa> isas) -> std::string;

// ============================================================================
// Other Code Generation Options
// ============================================================================

/// Math library used for transcendental functions.
enum class MathLib { Default, Fast, Svml, System };

/// Width of addressing calculations. The compiler defaults to 32 bit even
/// on 64 bit architectures.
enum class Addressing { A32, A64 };

/// Target CPU architecture.
enum class Architecture { Arm, Aarch64, X86, X86_64 };

/// Target CPU model.
enum class Cpu {
    Generic,
    Bonnell,
    Core2,
    Penryn,
    Nehalem,
    Ps4,
    SandyBridge,
    IvyBridge,
    Haswell,
    Broadwell,
    Knl,
    Skx,
    Icl,
    Silvermont,
    CortexA15,
    CortexA9,
    CortexA35,
    CortexA53,
    CortexA57,
};

/// Optimization switches passed as `--opt=`.
enum class OptimizationOpt {
    DisableAssertions,
    DisableFma,
    DisableLoopUnroll,
    FastMaskedVload,
    FastMath,
    ForceAlignedMemory,
    DisableZmm, ///< Requires compiler 1.13.0 or newer
};

/// Target operating system.
enum class TargetOs { Windows, Ps4, Linux, Macos, Android, Ios };

[[nodiscard]] auto math_lib_flag(MathLib lib) -> std::string_view;
[[nodiscard]] auto addressing_flag(Addressing addressing) -> std::string_view;
[[nodiscard]] auto architecture_flag(Architecture arch) -> std::string_view;
[[nodiscard]] auto cpu_flag(Cpu cpu) -> std::string_view;
[[nodiscard]] auto optimization_flag(OptimizationOpt opt) -> std::string_view;
[[nodiscard]] auto target_os_flag(TargetOs os) -> std::string_view;

/// Architecture implied by a target triple, if the compiler needs to be told.
[[nodiscard]] auto architecture_for_triple(std::string_view triple) -> std::optional<Architecture>;

/// True for triples whose toolchain is MSVC or whose OS is Windows.
[[nodiscard]] auto is_windows_triple(std::string_view triple) -> bool;

/// True for Apple triples (Mach-O objects, `.dylib` shared libraries).
[[nodiscard]] auto is_apple_triple(std::string_view triple) -> bool;

} // namespace simdbuild::target

#endif // SIMDBUILD_TARGET_TARGET_ISA_HPP
