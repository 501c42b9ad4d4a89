/**
 * @file  ratio_scalar.cpp
 * @brief Scalar reference implementation of the safety-ratio kernel.
 *
 * Module:  src/simd/
 *
 * Also serves as the tail loop of the vector kernels, so every path shares
 * this exact expression.
 */

#include "simd_batch_detail.hpp"
#include "polyreg/constants.hpp"

#include <algorithm>
#include <limits>

namespace polyreg::simd::detail {

void compute_ratio_scalar(
    double                        margin,
    const double* POLYREG_RESTRICT observed,
    std::size_t                   n,
    double* POLYREG_RESTRICT       out) noexcept
{
    constexpr double INF = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
        const double o = observed[i];
        out[i] = (o > 0.0) ? margin / std::max(o, constants::OBSERVED_EPSILON) : INF;
    }
}

} // namespace polyreg::simd::detail
