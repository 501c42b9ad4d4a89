#pragma once

/// @file include/polyreg/safety.hpp
/// @brief Safety-margin ratio, graded classification and positive-energy check.
///
/// # Module: Safety Margin Validator
///
/// ## Responsibility
/// Compare an energy-density-like observed quantity against a margin
/// constant and decide whether the ratio clears a threshold.
///
/// ## Core Formula
/// ```
/// ratio  = margin / max(observed, OBSERVED_EPSILON)   observed > 0
///        = +∞                                          observed ≤ 0
/// passes = ratio > threshold
/// ```
/// Observations at or below zero read as maximal safety.
///
/// ## Guarantees
/// - Pure functions; no logging, no shared state
/// - Batch overloads equal the scalar function mapped over the input; the
///   ratio pass runs through the SIMD kernels in simd_dispatch.hpp
/// - Out-of-domain input raises InvalidParameterError naming the parameter
///
/// ## NOT Responsible For
/// - Producing the observed quantity (see response.hpp)
/// - Any recovery or degraded mode: a failing assessment is just data

#include "polyreg/types.hpp"
#include "polyreg/constants.hpp"

#include <span>
#include <vector>

namespace polyreg::safety {

// ─── Assessment ───────────────────────────────────────────────────────────────

/// Assess one observed quantity against a margin constant.
///
/// # Arguments
/// * `margin_constant`   — Reference margin (finite, > 0)
/// * `observed_quantity` — Observation (finite; ≤ 0 gives ratio +∞)
/// * `threshold`         — Pass threshold (not NaN; default 1e12)
///
/// # Throws
/// InvalidParameterError if `margin_constant <= 0`, `observed_quantity` is
/// NaN or infinite, or `threshold` is NaN.
[[nodiscard]] SafetyAssessment
assess(double margin_constant,
       double observed_quantity,
       double threshold = constants::DEFAULT_SAFETY_THRESHOLD);

/// Assess every element of `observed_quantities`.
///
/// All inputs are validated before any ratio is computed; the error names
/// the index of the first non-finite observation.
[[nodiscard]] std::vector<SafetyAssessment>
assess(double                  margin_constant,
       std::span<const double> observed_quantities,
       double                  threshold = constants::DEFAULT_SAFETY_THRESHOLD);

/// Grade a ratio: ≥ safe_threshold → Safe, ≥ 1e6 → Caution,
/// ≥ 1e3 → Warning, otherwise Emergency.
///
/// # Throws
/// InvalidParameterError if `ratio` or `safe_threshold` is NaN.
[[nodiscard]] SafetyLevel
classify(double ratio, double safe_threshold = constants::DEFAULT_SAFETY_THRESHOLD);

/// Biological exposure check.
///
/// The largest tolerable exposure is 1 / biological_margin, and the ratio
/// of that to `exposure` must itself exceed `biological_margin`:
/// `assess(1 / biological_margin, exposure, biological_margin)`.
///
/// # Throws
/// InvalidParameterError if `biological_margin` is not finite and > 0, or
/// `exposure` is not finite.
[[nodiscard]] SafetyAssessment
assess_exposure(double exposure,
                double biological_margin = constants::DEFAULT_BIOLOGICAL_MARGIN);

// ─── Positive Energy ──────────────────────────────────────────────────────────

/// Stress-energy tensor of a field configuration: T = I₄ · Σ h_ij².
///
/// # Throws
/// InvalidParameterError if any entry of `field` is not finite.
[[nodiscard]] StressEnergyMatrix stress_energy(const FieldConfiguration& field);

/// True when every eigenvalue of the symmetric part of `tensor` is
/// ≥ `tolerance` (T_μν ≥ 0 up to rounding).
///
/// # Throws
/// InvalidParameterError if any entry of `tensor` is not finite.
[[nodiscard]] bool
satisfies_positive_energy(const StressEnergyMatrix& tensor,
                          double tolerance = constants::POSITIVE_ENERGY_TOLERANCE);

// ─── Formatting ───────────────────────────────────────────────────────────────

/// Upper-case name of a level ("SAFE", "CAUTION", "WARNING", "EMERGENCY").
[[nodiscard]] const char* to_string(SafetyLevel level) noexcept;

} // namespace polyreg::safety
