#include <gtest/gtest.h>
#include "polyreg/config.hpp"
#include "polyreg/errors.hpp"
#include "polyreg/response.hpp"

#include <string_view>
#include <vector>

using namespace polyreg;
using namespace polyreg::core;

namespace {

RunConfig parse(std::vector<std::string_view> args) {
    return parse_run_config(args);
}

} // anonymous namespace

// ─── Modes ────────────────────────────────────────────────────────────────────

TEST(Config_Parse, EmptyArgs_Throws) {
    EXPECT_THROW((void)parse({}), InvalidParameterError);
}

TEST(Config_Parse, UnknownMode_Throws) {
    try {
        (void)parse({"--frobnicate"});
        FAIL() << "expected InvalidParameterError";
    } catch (const InvalidParameterError& e) {
        EXPECT_STREQ(e.what(), "unknown option: --frobnicate");
    }
}

TEST(Config_Parse, Help) {
    EXPECT_EQ(parse({"--help"}).mode, RunMode::Help);
    EXPECT_EQ(parse({"-h"}).mode, RunMode::Help);
}

// ─── --compute ────────────────────────────────────────────────────────────────

TEST(Config_Compute, MuAndSeveralMomenta) {
    const auto cfg = parse({"--compute", "0.2", "1", "4", "+9"});
    EXPECT_EQ(cfg.mode, RunMode::Compute);
    EXPECT_DOUBLE_EQ(cfg.mu, 0.2);
    ASSERT_EQ(cfg.k_squared.size(), 3u);
    EXPECT_DOUBLE_EQ(cfg.k_squared[2], 9.0);
    EXPECT_EQ(cfg.formulation, Formulation::ScaledSinc);
}

TEST(Config_Compute, FormulationFlag) {
    const auto cfg = parse({"--compute", "0.2", "1", "--formulation", "legacy"});
    EXPECT_EQ(cfg.formulation, Formulation::LegacyNormalizedSinc);
    EXPECT_EQ(cfg.k_squared.size(), 1u);
}

TEST(Config_Compute, MissingMomentum_Throws) {
    EXPECT_THROW((void)parse({"--compute", "0.2"}), InvalidParameterError);
}

TEST(Config_Compute, BadNumber_Throws) {
    try {
        (void)parse({"--compute", "0.2", "four"});
        FAIL() << "expected InvalidParameterError";
    } catch (const InvalidParameterError& e) {
        EXPECT_STREQ(e.what(), "k_squared expects a number, got 'four'");
    }
}

TEST(Config_Compute, ThresholdNotAccepted) {
    EXPECT_THROW((void)parse({"--compute", "0.2", "1", "--threshold", "5"}),
                 InvalidParameterError);
}

// ─── --assess ─────────────────────────────────────────────────────────────────

TEST(Config_Assess, MarginAndObserved) {
    const auto cfg = parse({"--assess", "1.0", "1e-13"});
    EXPECT_EQ(cfg.mode, RunMode::Assess);
    EXPECT_DOUBLE_EQ(cfg.margin_constant, 1.0);
    EXPECT_DOUBLE_EQ(cfg.observed_quantity, 1e-13);
    EXPECT_DOUBLE_EQ(cfg.threshold, constants::DEFAULT_SAFETY_THRESHOLD);
}

TEST(Config_Assess, ThresholdFlag) {
    const auto cfg = parse({"--assess", "--threshold", "100", "1", "0.5"});
    EXPECT_DOUBLE_EQ(cfg.threshold, 100.0);
    EXPECT_DOUBLE_EQ(cfg.observed_quantity, 0.5);
}

TEST(Config_Assess, WrongArity_Throws) {
    EXPECT_THROW((void)parse({"--assess", "1"}), InvalidParameterError);
    EXPECT_THROW((void)parse({"--assess", "1", "2", "3"}), InvalidParameterError);
}

TEST(Config_Assess, FlagWithoutValue_Throws) {
    EXPECT_THROW((void)parse({"--assess", "1", "2", "--threshold"}), InvalidParameterError);
}

// ─── --spectrum ───────────────────────────────────────────────────────────────

TEST(Config_Spectrum, AllFields) {
    const auto cfg = parse({"--spectrum", "0.15", "1e-3", "1e3", "50"});
    EXPECT_EQ(cfg.mode, RunMode::Spectrum);
    EXPECT_DOUBLE_EQ(cfg.k_min, 1e-3);
    EXPECT_DOUBLE_EQ(cfg.k_max, 1e3);
    EXPECT_EQ(cfg.points, 50u);
}

TEST(Config_Spectrum, NonIntegerPoints_Throws) {
    EXPECT_THROW((void)parse({"--spectrum", "0.15", "1", "10", "2.5"}), InvalidParameterError);
    EXPECT_THROW((void)parse({"--spectrum", "0.15", "1", "10", "-3"}), InvalidParameterError);
}

// ─── --sweep ──────────────────────────────────────────────────────────────────

TEST(Config_Sweep, PathAndFlags) {
    const auto cfg = parse({"--sweep", "data.csv", "--mu", "0.3", "--margin", "2",
                            "--threshold", "1e6", "--formulation", "sine", "--verbose"});
    EXPECT_EQ(cfg.mode, RunMode::Sweep);
    EXPECT_EQ(cfg.input_path, "data.csv");
    EXPECT_TRUE(cfg.verbose);

    const auto engine = cfg.engine_config();
    EXPECT_DOUBLE_EQ(engine.mu, 0.3);
    EXPECT_DOUBLE_EQ(engine.margin_constant, 2.0);
    EXPECT_DOUBLE_EQ(engine.threshold, 1e6);
    EXPECT_EQ(engine.formulation, Formulation::SineRatio);
    EXPECT_TRUE(engine.verbose);
}

TEST(Config_Sweep, MissingPath_Throws) {
    EXPECT_THROW((void)parse({"--sweep"}), InvalidParameterError);
}

TEST(Config_Sweep, UnknownFlag_Throws) {
    EXPECT_THROW((void)parse({"--sweep", "data.csv", "--bogus", "1"}), InvalidParameterError);
}

// ─── parse_formulation ────────────────────────────────────────────────────────

TEST(Config_Formulation, Names) {
    EXPECT_EQ(parse_formulation("scaled"), Formulation::ScaledSinc);
    EXPECT_EQ(parse_formulation("sine"),   Formulation::SineRatio);
    EXPECT_EQ(parse_formulation("legacy"), Formulation::LegacyNormalizedSinc);
    EXPECT_THROW((void)parse_formulation("cosine"), InvalidParameterError);
}

TEST(Config_Formulation, RoundTripsThroughToString) {
    for (auto f : {Formulation::ScaledSinc, Formulation::SineRatio,
                   Formulation::LegacyNormalizedSinc}) {
        EXPECT_EQ(parse_formulation(response::to_string(f)), f);
    }
}
