/**
 * @file  ratio_avx2.cpp
 * @brief AVX2 (256-bit, 4-wide) safety-ratio kernel.
 *
 * Module:  src/simd/
 *
 * compare(> 0) → max(ε) → divide → blend(+∞ where not positive).
 * Tail elements use the scalar kernel.
 *
 * Compiled with -mavx2 / /arch:AVX2.
 */

#include "simd_batch_detail.hpp"
#include "polyreg/constants.hpp"

#include <immintrin.h>
#include <limits>

namespace polyreg::simd::detail {

void compute_ratio_avx2(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept
{
    constexpr std::size_t LANE = 4;
    const __m256d margin_v = _mm256_set1_pd(margin);
    const __m256d eps_v    = _mm256_set1_pd(constants::OBSERVED_EPSILON);
    const __m256d zero_v   = _mm256_setzero_pd();
    const __m256d inf_v    = _mm256_set1_pd(std::numeric_limits<double>::infinity());

    std::size_t i = 0;
    for (; i + LANE <= n; i += LANE) {
        const __m256d o        = _mm256_loadu_pd(observed + i);
        const __m256d positive = _mm256_cmp_pd(o, zero_v, _CMP_GT_OQ);
        const __m256d denom    = _mm256_max_pd(o, eps_v);
        const __m256d ratio    = _mm256_div_pd(margin_v, denom);
        _mm256_storeu_pd(out + i, _mm256_blendv_pd(inf_v, ratio, positive));
    }
    compute_ratio_scalar(margin, observed + i, n - i, out + i);
}

} // namespace polyreg::simd::detail
