#include "simdbuild/target/target_isa.hpp"

#include <array>

namespace simdbuild::target {

namespace {

struct IsaInfo {
    TargetIsa isa;
    std::string_view flag;
    std::string_view suffix;
};

// Indexed by the enum value.
constexpr std::array<IsaInfo, 21> ISA_TABLE = {{
    {TargetIsa::Host, "host", "host"},
    {TargetIsa::Sse2I32x4, "sse2-i32x4", "sse2"},
    {TargetIsa::Sse2I32x8, "sse2-i32x8", "sse2"},
    {TargetIsa::Sse4I32x4, "sse4-i32x4", "sse4"},
    {TargetIsa::Sse4I32x8, "sse4-i32x8", "sse4"},
    {TargetIsa::Sse4I16x8, "sse4-i16x8", "sse4"},
    {TargetIsa::Sse4I8x16, "sse4-i8x16", "sse4"},
    {TargetIsa::Avx1I32x4, "avx1-i32x4", "avx"},
    {TargetIsa::Avx1I32x8, "avx1-i32x8", "avx"},
    {TargetIsa::Avx1I32x16, "avx1-i32x16", "avx"},
    {TargetIsa::Avx1I64x4, "avx1-i64x4", "avx"},
    {TargetIsa::Avx2I32x8, "avx2-i32x8", "avx2"},
    {TargetIsa::Avx2I32x16, "avx2-i32x16", "avx2"},
    {TargetIsa::Avx2I64x4, "avx2-i64x4", "avx2"},
    {TargetIsa::Avx512KnlI32x16, "avx512knl-i32x16", "avx512knl"},
    {TargetIsa::Avx512SkxI32x16, "avx512skx-i32x16", "avx512skx"},
    {TargetIsa::Avx512SkxI32x8, "avx512skx-i32x8", "avx512skx"},
    {TargetIsa::NeonI8x16, "neon-i8x16", "neon"},
    {TargetIsa::NeonI16x8, "neon-i16x8", "neon"},
    {TargetIsa::NeonI32x4, "neon-i32x4", "neon"},
    {TargetIsa::NeonI32x8, "neon-i32x8", "neon"},
}};

constexpr std::array<TargetIsa, ISA_TABLE.size()> make_isa_list() {
    std::array<TargetIsa, ISA_TABLE.size()> out{};
    for (size_t i = 0; i < ISA_TABLE.size(); ++i) {
        out[i] = ISA_TABLE[i].isa;
    }
    return out;
}

constexpr auto ALL_ISAS = make_isa_list();

const IsaInfo& info(TargetIsa isa) {
    return ISA_TABLE[static_cast<size_t>(isa)];
}

} // namespace

auto all_isas() -> std::span<const TargetIsa> {
    return ALL_ISAS;
}

auto isa_flag(TargetIsa isa) -> std::string_view {
    return info(isa).flag;
}

auto isa_suffix(TargetIsa isa) -> std::string_view {
    return info(isa).suffix;
}

auto parse_isa(std::string_view flag) -> std::optional<TargetIsa> {
    for (const auto& entry : ISA_TABLE) {
        if (entry.flag == flag) {
            return entry.isa;
        }
    }
    return std::nullopt;
}

auto join_isa_flags(std::span<const TargetIsa> isas) -> std::string {
    std::string out;
    for (size_t i = 0; i < isas.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += isa_flag(isas[i]);
    }
    return out;
}

// ============================================================================
// Option Spellings
// ============================================================================

auto math_lib_flag(MathLib lib) -> std::string_view {
    switch (lib) {
    case MathLib::Default:
        return "--math-lib=default";
    case MathLib::Fast:
        return "--math-lib=fast";
    case MathLib::Svml:
        return "--math-lib=svml";
    case MathLib::System:
        return "--math-lib=system";
    }
    return "--math-lib=default";
}

auto addressing_flag(Addressing addressing) -> std::string_view {
    return addressing == Addressing::A32 ? "--addressing=32" : "--addressing=64";
}

auto architecture_flag(Architecture arch) -> std::string_view {
    switch (arch) {
    case Architecture::Arm:
        return "--arch=arm";
    case Architecture::Aarch64:
        return "--arch=aarch64";
    case Architecture::X86:
        return "--arch=x86";
    case Architecture::X86_64:
        return "--arch=x86-64";
    }
    return "";
}

auto cpu_flag(Cpu cpu) -> std::string_view {
    switch (cpu) {
    case Cpu::Generic:
        return "--cpu=generic";
    case Cpu::Bonnell:
        return "--cpu=bonnell";
    case Cpu::Core2:
        return "--cpu=core2";
    case Cpu::Penryn:
        return "--cpu=penryn";
    case Cpu::Nehalem:
        return "--cpu=nehalem";
    case Cpu::Ps4:
        return "--cpu=ps4";
    case Cpu::SandyBridge:
        return "--cpu=sandybridge";
    case Cpu::IvyBridge:
        return "--cpu=ivybridge";
    case Cpu::Haswell:
        return "--cpu=haswell";
    case Cpu::Broadwell:
        return "--cpu=broadwell";
    case Cpu::Knl:
        return "--cpu=knl";
    case Cpu::Skx:
        return "--cpu=skx";
    case Cpu::Icl:
        return "--cpu=icl";
    case Cpu::Silvermont:
        return "--cpu=silvermont";
    case Cpu::CortexA15:
        return "--cpu=cortex-a15";
    case Cpu::CortexA9:
        return "--cpu=cortex-a9";
    case Cpu::CortexA35:
        return "--cpu=cortex-a35";
    case Cpu::CortexA53:
        return "--cpu=cortex-a53";
    case Cpu::CortexA57:
        return "--cpu=cortex-a57";
    }
    return "";
}

auto optimization_flag(OptimizationOpt opt) -> std::string_view {
    switch (opt) {
    case OptimizationOpt::DisableAssertions:
        return "--opt=disable-assertions";
    case OptimizationOpt::DisableFma:
        return "--opt=disable-fma";
    case OptimizationOpt::DisableLoopUnroll:
        return "--opt=disable-loop-unroll";
    case OptimizationOpt::FastMaskedVload:
        return "--opt=fast-masked-vload";
    case OptimizationOpt::FastMath:
        return "--opt=fast-math";
    case OptimizationOpt::ForceAlignedMemory:
        return "--opt=force-aligned-memory";
    case OptimizationOpt::DisableZmm:
        return "--opt=disable-zmm";
    }
    return "";
}

auto target_os_flag(TargetOs os) -> std::string_view {
    switch (os) {
    case TargetOs::Windows:
        return "--target-os=windows";
    case TargetOs::Ps4:
        return "--target-os=ps4";
    case TargetOs::Linux:
        return "--target-os=linux";
    case TargetOs::Macos:
        return "--target-os=macos";
    case TargetOs::Android:
        return "--target-os=android";
    case TargetOs::Ios:
        return "--target-os=ios";
    }
    return "";
}

// ============================================================================
// Triples
// ============================================================================

auto architecture_for_triple(std::string_view triple) -> std::optional<Architecture> {
    if (triple.starts_with("x86_64")) {
        return Architecture::X86_64;
    }
    if (triple.starts_with("i686") || triple.starts_with("i586") || triple.starts_with("i386")) {
        return Architecture::X86;
    }
    if (triple.starts_with("aarch64") || triple.starts_with("arm64")) {
        return Architecture::Aarch64;
    }
    if (triple.starts_with("arm") || triple.starts_with("thumb")) {
        return Architecture::Arm;
    }
    return std::nullopt;
}

auto is_windows_triple(std::string_view triple) -> bool {
    return triple.find("windows") != std::string_view::npos ||
           triple.find("msvc") != std::string_view::npos;
}

auto is_apple_triple(std::string_view triple) -> bool {
    return triple.find("apple") != std::string_view::npos ||
           triple.find("darwin") != std::string_view::npos;
}

} // namespace simdbuild::target
