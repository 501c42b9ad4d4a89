#pragma once

#include <cstddef>

/// @file include/polyreg/constants.hpp
/// @brief Numerical defaults and tolerances for the polyreg library.
///
/// Every default that a caller may override at run time (through function
/// arguments or RunConfig) starts here.

namespace polyreg::constants {

// ─── Regularization Scale ─────────────────────────────────────────────────────

/// Default polymer scale μ used by the engine and CLI.
static constexpr double DEFAULT_POLYMER_SCALE = 0.15;

/// Below this |x| the sinc series 1 − x²/6 + x⁴/120 replaces sin(x)/x.
/// The truncation error is O(x⁶/5040), below one ulp of 1.0.
static constexpr double SINC_SERIES_THRESHOLD = 1e-4;

// ─── Spectrum Sweep ───────────────────────────────────────────────────────────

/// Default momentum-magnitude range for spectrum sweeps.
static constexpr double DEFAULT_SPECTRUM_K_MIN = 1e-3;
static constexpr double DEFAULT_SPECTRUM_K_MAX = 1e3;

/// Default number of log-spaced spectrum points.
static constexpr std::size_t DEFAULT_SPECTRUM_POINTS = 1000;

/// Lower edge of the high-momentum band sampled by the UV finiteness check.
static constexpr double UV_PROBE_K_MIN = 1e15;

/// Default upper edge of the high-momentum band.
static constexpr double UV_PROBE_K_MAX = 1e20;

/// Number of samples in the UV finiteness check.
static constexpr std::size_t UV_PROBE_POINTS = 100;

// ─── Exchange Amplitude ───────────────────────────────────────────────────────

/// Momenta above this magnitude give a zero exchange amplitude.
static constexpr double EXCHANGE_UV_CUTOFF = 1e19;

/// Momenta below this magnitude are raised to it before evaluation.
static constexpr double EXCHANGE_IR_CUTOFF = 1e-3;

/// Reference mass the energy scale is measured against, (E / M)².
static constexpr double PLANCK_MASS = 2.176e-8;

// ─── Safety Margin ────────────────────────────────────────────────────────────

/// Default pass threshold for the safety ratio.
static constexpr double DEFAULT_SAFETY_THRESHOLD = 1e12;

/// Default margin constant fed to assess() by the engine.
static constexpr double DEFAULT_MARGIN_CONSTANT = 1.0;

/// Floor applied to a positive observed quantity before division.
static constexpr double OBSERVED_EPSILON = 1e-20;

/// Ratio floor of the CAUTION band (below the safe threshold).
static constexpr double CAUTION_RATIO = 1e6;

/// Ratio floor of the WARNING band. Anything lower is EMERGENCY.
static constexpr double WARNING_RATIO = 1e3;

/// Default biological protection margin for exposure assessment.
static constexpr double DEFAULT_BIOLOGICAL_MARGIN = 1e12;

/// Smallest stress-energy eigenvalue still accepted as non-negative.
static constexpr double POSITIVE_ENERGY_TOLERANCE = -1e-15;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace polyreg::constants
