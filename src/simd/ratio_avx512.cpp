/**
 * @file  ratio_avx512.cpp
 * @brief AVX-512F (512-bit, 8-wide) safety-ratio kernel.
 *
 * Module:  src/simd/
 *
 * Same dataflow as the AVX2 kernel with an opmask instead of a blend vector.
 * Tail elements use the scalar kernel.
 *
 * Compiled with -mavx512f / /arch:AVX512.
 */

#include "simd_batch_detail.hpp"
#include "polyreg/constants.hpp"

#include <immintrin.h>
#include <limits>

namespace polyreg::simd::detail {

void compute_ratio_avx512(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept
{
    constexpr std::size_t LANE = 8;
    const __m512d margin_v = _mm512_set1_pd(margin);
    const __m512d eps_v    = _mm512_set1_pd(constants::OBSERVED_EPSILON);
    const __m512d zero_v   = _mm512_setzero_pd();
    const __m512d inf_v    = _mm512_set1_pd(std::numeric_limits<double>::infinity());

    std::size_t i = 0;
    for (; i + LANE <= n; i += LANE) {
        const __m512d   o        = _mm512_loadu_pd(observed + i);
        const __mmask8  positive = _mm512_cmp_pd_mask(o, zero_v, _CMP_GT_OQ);
        const __m512d   denom    = _mm512_max_pd(o, eps_v);
        const __m512d   ratio    = _mm512_div_pd(margin_v, denom);
        _mm512_storeu_pd(out + i, _mm512_mask_blend_pd(positive, inf_v, ratio));
    }
    compute_ratio_scalar(margin, observed + i, n - i, out + i);
}

} // namespace polyreg::simd::detail
