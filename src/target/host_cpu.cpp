#include "simdbuild/target/host_cpu.hpp"

namespace simdbuild::target {

bool CpuFeatures::supports(TargetIsa isa) const {
    switch (isa) {
    case TargetIsa::Host:
        return true;
    case TargetIsa::Sse2I32x4:
    case TargetIsa::Sse2I32x8:
        return sse2;
    case TargetIsa::Sse4I32x4:
    case TargetIsa::Sse4I32x8:
    case TargetIsa::Sse4I16x8:
    case TargetIsa::Sse4I8x16:
        return sse4;
    case TargetIsa::Avx1I32x4:
    case TargetIsa::Avx1I32x8:
    case TargetIsa::Avx1I32x16:
    case TargetIsa::Avx1I64x4:
        return avx;
    case TargetIsa::Avx2I32x8:
    case TargetIsa::Avx2I32x16:
    case TargetIsa::Avx2I64x4:
        return avx2;
    case TargetIsa::Avx512KnlI32x16:
        return avx512knl;
    case TargetIsa::Avx512SkxI32x16:
    case TargetIsa::Avx512SkxI32x8:
        return avx512skx;
    case TargetIsa::NeonI8x16:
    case TargetIsa::NeonI16x8:
    case TargetIsa::NeonI32x4:
    case TargetIsa::NeonI32x8:
        return neon;
    }
    return false;
}

static CpuFeatures detect_features() {
    CpuFeatures features;
#if defined(__x86_64__) || defined(__i386__)
    __builtin_cpu_init();
    features.sse2 = __builtin_cpu_supports("sse2");
    features.sse4 = __builtin_cpu_supports("sse4.2");
    features.avx = __builtin_cpu_supports("avx");
    features.avx2 = __builtin_cpu_supports("avx2") && __builtin_cpu_supports("fma");
    features.avx512knl = __builtin_cpu_supports("avx512f") && __builtin_cpu_supports("avx512er") &&
                         __builtin_cpu_supports("avx512pf");
    features.avx512skx = __builtin_cpu_supports("avx512f") && __builtin_cpu_supports("avx512dq") &&
                         __builtin_cpu_supports("avx512bw") && __builtin_cpu_supports("avx512vl");
#elif defined(__aarch64__) || defined(__ARM_NEON)
    features.neon = true;
#endif
    return features;
}

auto host_cpu_features() -> const CpuFeatures& {
    static const CpuFeatures features = detect_features();
    return features;
}

auto select_isa(std::span<const TargetIsa> requested, const CpuFeatures& features)
    -> std::optional<TargetIsa> {
    std::optional<TargetIsa> best;
    for (auto isa : requested) {
        if (!features.supports(isa)) {
            continue;
        }
        if (!best || static_cast<int>(isa) > static_cast<int>(*best)) {
            best = isa;
        }
    }
    return best;
}

auto select_isa(std::span<const TargetIsa> requested) -> std::optional<TargetIsa> {
    return select_isa(requested, host_cpu_features());
}

} // namespace simdbuild::target
