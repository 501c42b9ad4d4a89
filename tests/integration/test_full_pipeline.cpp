/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the response → safety pipeline.
///
/// These tests exercise the complete path:
///   CSV text → DataLoader → Engine (response::compute → safety::assess →
///   safety::classify) → SweepSummary

#include "polyreg/engine.hpp"
#include "polyreg/data_loader.hpp"
#include "polyreg/response.hpp"
#include "polyreg/safety.hpp"
#include "polyreg/constants.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace polyreg;
using namespace polyreg::core;
using namespace polyreg::constants;

// ─── Response feeding assessment ──────────────────────────────────────────────

TEST(EndToEnd, ComputeThenAssess_ModerateMomentumFails) {
    const double g = response::compute(0.15, 4.0);
    // μ²·sinc²(0.3) = sin²(0.3) / 4
    EXPECT_NEAR(g, std::sin(0.3) * std::sin(0.3) / 4.0, 1e-15);

    const auto a = safety::assess(1.0, g);
    EXPECT_NEAR(a.ratio, 1.0 / g, 1e-9);
    EXPECT_FALSE(a.passes);
    EXPECT_EQ(safety::classify(a.ratio), SafetyLevel::Emergency);
}

TEST(EndToEnd, SpectrumRatiosNeverBelowInfraredFloor) {
    // G ≤ μ² everywhere, so no ratio can drop below margin / μ².
    const auto sweep = response::spectrum(0.15);
    std::vector<double> responses;
    responses.reserve(sweep.size());
    for (const auto& p : sweep) responses.push_back(p.response);

    const auto assessments = safety::assess(1.0, responses);
    ASSERT_EQ(assessments.size(), sweep.size());
    for (const auto& a : assessments) {
        EXPECT_GE(a.ratio, 1.0 / (0.15 * 0.15) * (1.0 - 1e-12));
    }
}

TEST(EndToEnd, UvProbePassesSafetyEverywhere) {
    const auto report = response::check_uv_finiteness(0.15);
    ASSERT_TRUE(report.finite);
    // Every sampled response is at most 1 / k² ≤ 1e-15, so ratios exceed 1e12.
    const auto a = safety::assess(1.0, report.max_response);
    EXPECT_TRUE(a.passes);
}

// ─── CSV sweep through the Engine ─────────────────────────────────────────────

TEST(EndToEnd, CsvSweepThroughEngine) {
    const std::string csv =
        "# momentum sweep\n"
        "k_squared,label\n"
        "0,ir\n"
        "4,moderate\n"
        "not-a-number,skip\n"
        "1e30,deep-uv\n";

    const auto k2 = DataLoader::parse_csv_string(csv);
    ASSERT_EQ(k2.size(), 3u);

    Engine engine;
    const auto points = engine.evaluate_series(k2);
    ASSERT_EQ(points.size(), 3u);

    EXPECT_DOUBLE_EQ(points[0].response, DEFAULT_POLYMER_SCALE * DEFAULT_POLYMER_SCALE);
    EXPECT_FALSE(points[0].assessment.passes);
    EXPECT_FALSE(points[1].assessment.passes);
    EXPECT_TRUE(points[2].assessment.passes);

    const auto summary = Engine::summarise(points);
    EXPECT_EQ(summary.count, 3u);
    EXPECT_EQ(summary.passed, 1u);
    EXPECT_DOUBLE_EQ(summary.max_response, points[0].response);
}

TEST(EndToEnd, LooseThresholdPassesEverything) {
    Engine engine(EngineConfig{.threshold = 10.0});
    const std::vector<double> k2 = {0.0, 1.0, 100.0, 1e8};
    const auto points = engine.evaluate_series(k2);
    EXPECT_TRUE(std::all_of(points.begin(), points.end(),
                            [](const EvaluatedPoint& p) { return p.assessment.passes; }));
}

TEST(EndToEnd, FormulationsAgreeAwayFromOrigin) {
    const std::vector<double> k2 = {0.01, 1.0, 25.0, 1e4};
    Engine scaled(EngineConfig{.formulation = Formulation::ScaledSinc});
    Engine sine(EngineConfig{.formulation = Formulation::SineRatio});
    const auto a = scaled.evaluate_series(k2);
    const auto b = sine.evaluate_series(k2);
    for (std::size_t i = 0; i < k2.size(); ++i) {
        EXPECT_NEAR(a[i].response, b[i].response, 1e-12 * a[i].response + 1e-300)
            << "k2 = " << k2[i];
        EXPECT_EQ(a[i].level, b[i].level);
    }
}

// ─── Exposure and positive-energy checks ──────────────────────────────────────

TEST(EndToEnd, StressEnergyOfResponseScaledFieldIsPositive) {
    const double g = response::compute(0.15, 1.0);
    const FieldConfiguration h = FieldConfiguration::Identity() * g;
    EXPECT_TRUE(safety::satisfies_positive_energy(safety::stress_energy(h)));
}
