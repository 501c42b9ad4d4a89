/// @file src/core/engine.cpp
/// @brief Response → safety pipeline over a sweep of momentum inputs.

#include "polyreg/engine.hpp"
#include "polyreg/errors.hpp"
#include "polyreg/response.hpp"
#include "polyreg/safety.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace polyreg::core {

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{
    if (!(config_.mu > 0.0) || !std::isfinite(config_.mu)) {
        throw InvalidParameterError("mu", "mu must be > 0");
    }
    if (!std::isfinite(config_.mu * config_.mu)) {
        throw InvalidParameterError("mu", "mu must be small enough that mu^2 is finite");
    }
    if (!(config_.margin_constant > 0.0) || !std::isfinite(config_.margin_constant)) {
        throw InvalidParameterError("margin_constant", "margin_constant must be > 0");
    }
    if (std::isnan(config_.threshold)) {
        throw InvalidParameterError("threshold", "threshold must not be NaN");
    }
}

// ─── Engine::evaluate ─────────────────────────────────────────────────────────

EvaluatedPoint Engine::evaluate(double k_squared) const {
    const double response = response::compute(config_.mu, k_squared, config_.formulation);
    const SafetyAssessment assessment =
        safety::assess(config_.margin_constant, response, config_.threshold);

    EvaluatedPoint point{
        .k_squared  = k_squared,
        .response   = response,
        .assessment = assessment,
        .level      = safety::classify(assessment.ratio, config_.threshold),
    };
    trace(point);
    return point;
}

// ─── Engine::evaluate_series ──────────────────────────────────────────────────

std::vector<EvaluatedPoint>
Engine::evaluate_series(std::span<const double> k_squared) const {
    // ── Step 1: responses (validates every k² before computing any) ──────────
    const auto responses = response::compute(config_.mu, k_squared, config_.formulation);

    // ── Step 2: ratios through the SIMD-dispatched kernel ────────────────────
    const auto assessments =
        safety::assess(config_.margin_constant, responses, config_.threshold);

    // ── Step 3: grade and collect ────────────────────────────────────────────
    std::vector<EvaluatedPoint> out;
    out.reserve(k_squared.size());
    for (std::size_t i = 0; i < k_squared.size(); ++i) {
        out.push_back(EvaluatedPoint{
            .k_squared  = k_squared[i],
            .response   = responses[i],
            .assessment = assessments[i],
            .level      = safety::classify(assessments[i].ratio, config_.threshold),
        });
        trace(out.back());
    }
    return out;
}

// ─── Engine::summarise ────────────────────────────────────────────────────────

SweepSummary Engine::summarise(std::span<const EvaluatedPoint> points) noexcept {
    SweepSummary s;
    if (points.empty()) {
        return s;
    }

    s.count     = points.size();
    s.min_ratio = std::numeric_limits<double>::infinity();
    for (const auto& p : points) {
        if (p.assessment.passes) {
            ++s.passed;
        }
        s.min_ratio    = std::min(s.min_ratio, p.assessment.ratio);
        s.max_response = std::max(s.max_response, p.response);
    }
    return s;
}

// ─── SweepSummary::to_string ──────────────────────────────────────────────────

std::string SweepSummary::to_string() const {
    return fmt::format(
        "Points evaluated : {}\n"
        "Points passing   : {} ({:.1f}%)\n"
        "Minimum ratio    : {:.6e}\n"
        "Maximum response : {:.12g}",
        count,
        passed,
        count == 0 ? 0.0 : 100.0 * static_cast<double>(passed) / static_cast<double>(count),
        min_ratio,
        max_response);
}

// ─── Engine::trace ────────────────────────────────────────────────────────────

void Engine::trace(const EvaluatedPoint& point) const {
    if (!config_.verbose) {
        return;
    }
    fmt::print(stderr, "[polyreg] k2={:.6g} G={:.12g} ratio={:.6e} passes={} level={}\n",
               point.k_squared,
               point.response,
               point.assessment.ratio,
               point.assessment.passes,
               safety::to_string(point.level));
}

} // namespace polyreg::core
