#pragma once
/**
 * @file  simd_batch_detail.hpp
 * @brief Internal raw-double signatures of the safety-ratio kernels.
 *
 * Module:  src/simd/  (internal; do NOT include from public headers)
 *
 * Kernel contract
 * ---------------
 *   out[i] = observed[i] > 0 ? margin / max(observed[i], OBSERVED_EPSILON)
 *                            : +∞
 *
 *   • noexcept; no validation (callers pass finite inputs, margin > 0).
 *   • Tail elements (n % LANE != 0) go through the scalar expression.
 *   • Unaligned loads/stores; `observed` and `out` must not alias.
 *
 * The AVX2 / AVX-512 kernels exist only when POLYREG_X86_KERNELS is defined
 * by the build (x86 targets).
 */

#include <cstddef>

#if defined(_MSC_VER)
#  define POLYREG_RESTRICT __restrict
#else
#  define POLYREG_RESTRICT __restrict__
#endif

namespace polyreg::simd::detail {

void compute_ratio_scalar(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept;

#if defined(POLYREG_X86_KERNELS)

void compute_ratio_avx2(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept;

void compute_ratio_avx512(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept;

#endif

} // namespace polyreg::simd::detail
