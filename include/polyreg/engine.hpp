#pragma once

/// @file include/polyreg/engine.hpp
/// @brief Response → safety pipeline over a sweep of momentum inputs.
///
/// # Module: Engine
///
/// ## Responsibility
/// Evaluate the regularized response at each k² and feed the result, as the
/// observed quantity, into the safety-margin assessment:
///   k² → response::compute → safety::assess → safety::classify
///
/// ## Usage
/// ```cpp
/// polyreg::core::Engine engine;                    // μ = 0.15, margin = 1, threshold = 1e12
/// auto bars = polyreg::core::DataLoader::load_csv("sweep.csv");
/// if (bars) {
///     auto points = engine.evaluate_series(*bars);
///     fmt::print("{}\n", polyreg::core::Engine::summarise(points).to_string());
/// }
/// ```
///
/// ## Guarantees
/// - Configuration is validated once, at construction
/// - `evaluate` and `evaluate_series` are const and thread-safe
/// - Invalid inputs raise InvalidParameterError; nothing is swallowed

#include "polyreg/types.hpp"
#include "polyreg/constants.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace polyreg::core {

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Parameters shared by every point of a sweep.
struct EngineConfig {
    /// Polymer scale μ (> 0).
    double mu = constants::DEFAULT_POLYMER_SCALE;

    /// Response formula.
    Formulation formulation = Formulation::ScaledSinc;

    /// Margin constant compared against each response (> 0).
    double margin_constant = constants::DEFAULT_MARGIN_CONSTANT;

    /// Ratio a point must exceed to pass; also the SAFE floor for classify().
    double threshold = constants::DEFAULT_SAFETY_THRESHOLD;

    /// If true, emit per-point diagnostics to stderr.
    bool verbose = false;
};

// ─── EvaluatedPoint ───────────────────────────────────────────────────────────

/// Full pipeline output for one k².
struct EvaluatedPoint {
    double           k_squared;  ///< Input momentum-squared
    double           response;   ///< G(k²) under the configured formulation
    SafetyAssessment assessment; ///< assess(margin, response, threshold)
    SafetyLevel      level;      ///< classify(assessment.ratio, threshold)
};

// ─── SweepSummary ─────────────────────────────────────────────────────────────

/// Aggregate view of a sweep.
struct SweepSummary {
    std::size_t count        = 0;   ///< Points evaluated
    std::size_t passed       = 0;   ///< Points with assessment.passes
    double      min_ratio    = 0.0; ///< Smallest ratio (+∞ if every point was ≤ 0)
    double      max_response = 0.0; ///< Largest response

    /// Multi-line human-readable rendering.
    [[nodiscard]] std::string to_string() const;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    /// Construct with a validated configuration.
    ///
    /// # Throws
    /// InvalidParameterError if `mu` or `margin_constant` is not finite and
    /// > 0, or `threshold` is NaN.
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Run the pipeline for a single k².
    [[nodiscard]] EvaluatedPoint evaluate(double k_squared) const;

    /// Run the pipeline for every k² in order.
    ///
    /// Equivalent to calling evaluate() per element; the batch response and
    /// batch assessment paths are used.
    [[nodiscard]] std::vector<EvaluatedPoint>
    evaluate_series(std::span<const double> k_squared) const;

    /// Summarise a sweep. An empty sweep yields a zeroed summary.
    [[nodiscard]] static SweepSummary summarise(std::span<const EvaluatedPoint> points) noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void trace(const EvaluatedPoint& point) const;

    EngineConfig config_;
};

} // namespace polyreg::core
