#pragma once
/**
 * @file  simd_dispatch.hpp
 * @brief Vectorised safety-ratio batch computation.
 *
 * Module:  include/polyreg/simd/
 *
 * Responsibility
 * --------------
 * Compute the safety ratio for a whole batch of observed quantities:
 *
 *   ratio_i = observed_i > 0 ? margin / max(observed_i, OBSERVED_EPSILON)
 *                            : +∞
 *
 * The widest kernel the CPU supports (AVX-512F → AVX2 → scalar) is chosen
 * once at first use.
 *
 * Guarantees
 * ----------
 *   • All functions are noexcept.
 *   • Inputs must already be validated: margin finite and > 0, every
 *     observed_i finite. safety::assess() does this before calling in.
 *   • Results are bit-identical to the scalar reference path; max and
 *     division are exactly rounded in every instruction set used.
 *
 * NOT Responsible For
 * -------------------
 *   • Input validation and error reporting (see safety.hpp).
 *   • The pass/fail comparison against a threshold.
 */

#include "polyreg/simd/cpu_features.hpp"

#include <span>
#include <vector>

namespace polyreg::simd {

/**
 * @brief Ratio of `margin` to every element of `observed`.
 *
 * @param margin    Margin constant (finite, > 0).
 * @param observed  Observed quantities (each finite).
 * @return          One ratio per input, in order.
 *
 * @code
 *   std::vector<double> obs = {1e-13, 0.0, -2.0};
 *   auto r = polyreg::simd::compute_ratio_batch(1.0, obs);  // {1e13, inf, inf}
 * @endcode
 */
[[nodiscard]] std::vector<double>
compute_ratio_batch(double margin, std::span<const double> observed) noexcept;

// ── RatioCalculator ───────────────────────────────────────────────────────────

/**
 * @brief Holds a margin constant and the SIMD level selected for it.
 *
 * Immutable after construction; safe to share between threads.
 */
class RatioCalculator {
public:
    /// @param margin  Margin constant (finite, > 0; not re-validated here).
    explicit RatioCalculator(double margin) noexcept;

    /// Ratio for each observed quantity.
    [[nodiscard]] std::vector<double>
    compute(std::span<const double> observed) const noexcept;

    [[nodiscard]] double margin() const noexcept;

    /// SIMD level in use (reflects the current CPU).
    [[nodiscard]] SimdLevel simd_level() const noexcept;

private:
    double    margin_;
    SimdLevel simd_level_{ SimdLevel::SCALAR };
};

} // namespace polyreg::simd
