#pragma once

/// @file include/polyreg/types.hpp
/// @brief Shared value types for the polyreg library.
///
/// All modules include this file. It defines the computed value types and
/// the Eigen aliases for the 4×4 tensors used by the positive-energy check.

#include "polyreg/constants.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>

namespace polyreg {

/// Dimensionality of the tensors in the positive-energy check (1 time + 3 space).
static constexpr int SPACETIME_DIM = 4;

// ─── Response ─────────────────────────────────────────────────────────────────

/// Formula used to evaluate the regularized response.
enum class Formulation : std::uint8_t {
    /// μ² · sinc²(μ√k²). Continuous at k² = 0; the default.
    ScaledSinc = 0,
    /// sin²(μ√k²) / k² with an explicit k² → 0 limit branch returning μ².
    SineRatio = 1,
    /// Compatibility mode: normalised sinc(μ√k²)² / k², 0 at k² = 0.
    LegacyNormalizedSinc = 2,
};

/// One sample of a response spectrum.
struct SpectrumPoint {
    double k_squared; ///< Momentum-squared at this sample
    double response;  ///< compute(μ, k_squared)
};

/// Outcome of probing the response over a very-high-momentum band.
struct UvFinitenessReport {
    bool        finite;            ///< Every sampled response was finite
    double      max_response;      ///< Largest sampled response
    double      suppression_ratio; ///< last / first sample (0 if first is 0)
    std::size_t samples;           ///< Number of samples taken
};

/// Momentum window of an exchange amplitude: k > uv gives 0, k < ir is
/// evaluated at ir.
struct ExchangeCutoffs {
    double ir = constants::EXCHANGE_IR_CUTOFF;
    double uv = constants::EXCHANGE_UV_CUTOFF;
};

// ─── Safety ───────────────────────────────────────────────────────────────────

/// Ratio of a margin constant to an observed quantity, and its verdict.
struct SafetyAssessment {
    double ratio;  ///< margin / max(observed, ε), or +∞ for observed ≤ 0
    bool   passes; ///< ratio > threshold
};

/// Graded reading of a safety ratio, from most to least comfortable.
enum class SafetyLevel : std::uint8_t {
    Safe      = 0, ///< ratio ≥ safe threshold
    Caution   = 1, ///< ratio ≥ CAUTION_RATIO
    Warning   = 2, ///< ratio ≥ WARNING_RATIO
    Emergency = 3, ///< anything lower
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Metric perturbation h_μν sampled at one point.
using FieldConfiguration = Eigen::Matrix<double, SPACETIME_DIM, SPACETIME_DIM>;

/// Stress-energy tensor T_μν.
using StressEnergyMatrix = Eigen::Matrix<double, SPACETIME_DIM, SPACETIME_DIM>;

} // namespace polyreg
