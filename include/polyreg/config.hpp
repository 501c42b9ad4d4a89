#pragma once

/// @file include/polyreg/config.hpp
/// @brief Command-line run configuration for the polyreg executable.
///
/// Defaults come from constants.hpp; the command line is the only source
/// of overrides. Parsing is strict: a value that does not parse as a number
/// in full raises InvalidParameterError naming the flag. Domain checks
/// (μ > 0, k² ≥ 0, ...) are left to the library calls that consume the values.

#include "polyreg/types.hpp"
#include "polyreg/constants.hpp"
#include "polyreg/engine.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace polyreg::core {

/// Top-level action selected by the first argument.
enum class RunMode {
    Help,     ///< --help / -h
    Compute,  ///< --compute <mu> <k_squared>...
    Assess,   ///< --assess <margin> <observed>
    Spectrum, ///< --spectrum <mu> <k_min> <k_max> <points>
    Sweep,    ///< --sweep <csv_file>
};

struct RunConfig {
    RunMode mode = RunMode::Help;

    double              mu          = constants::DEFAULT_POLYMER_SCALE;
    std::vector<double> k_squared;
    Formulation         formulation = Formulation::ScaledSinc;

    double margin_constant   = constants::DEFAULT_MARGIN_CONSTANT;
    double observed_quantity = 0.0;
    double threshold         = constants::DEFAULT_SAFETY_THRESHOLD;

    double      k_min  = constants::DEFAULT_SPECTRUM_K_MIN;
    double      k_max  = constants::DEFAULT_SPECTRUM_K_MAX;
    std::size_t points = constants::DEFAULT_SPECTRUM_POINTS;

    std::string input_path;
    bool        verbose = false;

    /// Engine configuration implied by this run.
    [[nodiscard]] EngineConfig engine_config() const;
};

/// Parse arguments (excluding the program name).
///
/// # Throws
/// InvalidParameterError for an unknown mode or option, a missing or extra
/// positional argument, or a value that is not a number.
[[nodiscard]] RunConfig parse_run_config(std::span<const std::string_view> args);

/// Parse a formulation name: "scaled", "sine" or "legacy".
///
/// # Throws
/// InvalidParameterError for any other name.
[[nodiscard]] Formulation parse_formulation(std::string_view name);

} // namespace polyreg::core
