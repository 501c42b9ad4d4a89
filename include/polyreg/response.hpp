#pragma once

/// @file include/polyreg/response.hpp
/// @brief Regularized response G(k) = μ² · sinc²(μ√k²) and its variants.
///
/// # Module: Regularized Response
///
/// ## Responsibility
/// Evaluate the polymer-regularized response for a scale μ and a
/// momentum-squared k², for single values and contiguous batches.
///
/// ## Core Formula
/// ```
/// sinc(x) = sin(x) / x,   sinc(0) = 1
/// G(k²)   = μ² · sinc²(μ · √k²)
///         = sin²(μ√k²) / k²          for k² > 0
/// ```
/// G is continuous at the removable singularity (G(0) = μ²) and bounded by
/// its zero-argument value: 0 ≤ G(k²) ≤ μ².
///
/// ## Guarantees
/// - Pure functions; no logging, no shared state, safe to call concurrently
/// - Batch overloads equal the scalar function mapped over the input
/// - Out-of-domain input raises InvalidParameterError naming the parameter
///
/// ## NOT Responsible For
/// - Comparing responses against a safety margin (see safety.hpp)
/// - Reading inputs from disk (see data_loader.hpp)

#include "polyreg/types.hpp"
#include "polyreg/constants.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace polyreg::response {

// ─── Primitives ───────────────────────────────────────────────────────────────

/// Unnormalised sinc: sin(x)/x with sinc(0) = 1.
///
/// Uses the series 1 − x²/6 + x⁴/120 for |x| < SINC_SERIES_THRESHOLD.
[[nodiscard]] double sinc(double x) noexcept;

// ─── Response ─────────────────────────────────────────────────────────────────

/// Compute G(k²) = μ² · sinc²(μ√k²).
///
/// # Arguments
/// * `mu`        — Polymer scale (finite, > 0)
/// * `k_squared` — Momentum-squared (finite, ≥ 0)
///
/// # Returns
/// A finite value in [0, μ²]; exactly μ² at k² = 0.
///
/// # Throws
/// InvalidParameterError if `mu <= 0` or `k_squared < 0` (NaN and ±∞ included).
[[nodiscard]] double compute(double mu, double k_squared);

/// Compute G for every element of `k_squared`.
///
/// Element i of the result equals `compute(mu, k_squared[i])`. The whole
/// input is validated before any value is produced; the error names the
/// index of the first invalid element.
[[nodiscard]] std::vector<double>
compute(double mu, std::span<const double> k_squared);

/// Compute the response with an explicit formulation.
///
/// `ScaledSinc` matches compute(mu, k_squared). `SineRatio` is the same
/// function evaluated as sin²(μ√k²)/k². `LegacyNormalizedSinc` reproduces
/// sinc_π(μ√k²)²/k² with the normalised sinc sin(πx)/(πx), returning 0 at
/// k² = 0; it is a compatibility mode and is never selected by default.
[[nodiscard]] double compute(double mu, double k_squared, Formulation formulation);

/// Batch overload of the formulation-aware compute().
[[nodiscard]] std::vector<double>
compute(double mu, std::span<const double> k_squared, Formulation formulation);

/// Mass-normalised variant: sinc²(μ√k²) / (k² + m²).
///
/// Returns 1/m² at k² = 0.
///
/// # Throws
/// InvalidParameterError for invalid `mu`, `k_squared`, or `mass <= 0`.
[[nodiscard]] double compute_massive(double mu, double k_squared, double mass);

/// Envelope relative to the classical 1/k² response: sinc²(μ√k²) ∈ [0, 1].
///
/// # Throws
/// InvalidParameterError for invalid `mu`, or `k_squared` that is not > 0
/// (the classical response has no value at k² = 0).
[[nodiscard]] double enhancement_over_classical(double mu, double k_squared);

/// Exchange amplitude at momentum magnitude `k` and energy scale `E`:
/// `coupling · (E / PLANCK_MASS)² · sinc²(μk) / k²`, with `k` raised to
/// `cutoffs.ir` when below it and a zero amplitude when `k > cutoffs.uv`.
///
/// The amplitude is real; there is no absorptive part.
///
/// # Throws
/// InvalidParameterError for invalid `mu`, a `k` that is negative or not
/// finite, a non-finite `energy_scale` or `coupling`, or cutoffs that are
/// not `0 < ir < uv` (both finite).
[[nodiscard]] double exchange_amplitude(double          mu,
                                        double          k,
                                        double          energy_scale,
                                        double          coupling = 1.0,
                                        ExchangeCutoffs cutoffs  = ExchangeCutoffs{});

// ─── Sweeps ───────────────────────────────────────────────────────────────────

/// Evaluate G over log-spaced momentum magnitudes k ∈ [k_min, k_max].
///
/// Each point carries k² = k·k. The first point is exactly k_min², the last
/// exactly k_max².
///
/// # Throws
/// InvalidParameterError unless `0 < k_min < k_max` (both finite) and
/// `points >= 2`, or if `mu` is invalid.
[[nodiscard]] std::vector<SpectrumPoint>
spectrum(double      mu,
         double      k_min  = constants::DEFAULT_SPECTRUM_K_MIN,
         double      k_max  = constants::DEFAULT_SPECTRUM_K_MAX,
         std::size_t points = constants::DEFAULT_SPECTRUM_POINTS);

/// Probe G over UV_PROBE_POINTS log-spaced k in [UV_PROBE_K_MIN, k_max].
///
/// # Throws
/// InvalidParameterError if `k_max <= UV_PROBE_K_MIN` or `mu` is invalid.
[[nodiscard]] UvFinitenessReport
check_uv_finiteness(double mu, double k_max = constants::UV_PROBE_K_MAX);

// ─── Formatting ───────────────────────────────────────────────────────────────

/// Short lowercase name for a formulation ("scaled", "sine", "legacy").
[[nodiscard]] const char* to_string(Formulation formulation) noexcept;

} // namespace polyreg::response
