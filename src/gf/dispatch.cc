#include "gf/dispatch.hh"
#include "gf/kernels.hh"
#include "core/logging.hh"
#include <algorithm>

namespace rsec {

namespace {

constexpr Kernels BASE_KERNELS{
    SimdLevel::BASE, &detail::base_dot_prod, &detail::base_mad, &detail::base_vect_mul};

#if defined(RSEC_HAVE_X86_KERNELS)
constexpr Kernels SSSE3_KERNELS{
    SimdLevel::SSSE3, &detail::ssse3_dot_prod, &detail::ssse3_mad, &detail::ssse3_vect_mul};
constexpr Kernels AVX2_KERNELS{
    SimdLevel::AVX2, &detail::avx2_dot_prod, &detail::avx2_mad, &detail::avx2_vect_mul};
#endif

SimdLevel query_cpu() {
#if defined(RSEC_HAVE_X86_KERNELS)
    __builtin_cpu_init();
    if (__builtin_cpu_supports("avx2")) {
        return SimdLevel::AVX2;
    }
    if (__builtin_cpu_supports("ssse3")) {
        return SimdLevel::SSSE3;
    }
#endif
    return SimdLevel::BASE;
}

}  // namespace

SimdLevel detect_simd_level() {
    static const SimdLevel level = [] {
        SimdLevel detected = query_cpu();
        log::dispatch.debug() << "Selected " << simd_level_name(detected) << " kernels";
        return detected;
    }();
    return level;
}

const Kernels& kernels_for(SimdLevel level) {
    level = std::min(level, detect_simd_level());
    switch (level) {
#if defined(RSEC_HAVE_X86_KERNELS)
        case SimdLevel::AVX2: return AVX2_KERNELS;
        case SimdLevel::SSSE3: return SSSE3_KERNELS;
#endif
        default: return BASE_KERNELS;
    }
}

const Kernels& active_kernels() {
    static const Kernels& kernels = kernels_for(detect_simd_level());
    return kernels;
}

}  // namespace rsec
