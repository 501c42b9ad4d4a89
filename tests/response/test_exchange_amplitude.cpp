#include <gtest/gtest.h>
#include "polyreg/response.hpp"
#include "polyreg/errors.hpp"
#include "polyreg/constants.hpp"
#include <cmath>
#include <limits>

using namespace polyreg;
using namespace polyreg::response;
using namespace polyreg::constants;

TEST(ExchangeAmplitude, PlanckEnergyUnitCoupling_IsSincSquaredOverKSquared) {
    const double s = std::sin(0.3) / 0.3;
    EXPECT_NEAR(exchange_amplitude(0.15, 2.0, PLANCK_MASS), s * s / 4.0, 1e-15);
}

TEST(ExchangeAmplitude, ScalesWithCouplingAndEnergySquared) {
    const double base = exchange_amplitude(0.15, 3.0, PLANCK_MASS);
    EXPECT_NEAR(exchange_amplitude(0.15, 3.0, PLANCK_MASS, 2.5), 2.5 * base, 1e-14 * base);
    EXPECT_NEAR(exchange_amplitude(0.15, 3.0, 2.0 * PLANCK_MASS), 4.0 * base, 1e-14 * base);
}

TEST(ExchangeAmplitude, AboveUvCutoff_Zero) {
    EXPECT_EQ(exchange_amplitude(0.15, 2e19, 1.0), 0.0);
    EXPECT_GT(exchange_amplitude(0.15, 10.0, 1.0, 1.0, {.ir = 1e-3, .uv = 100.0}), 0.0);
    EXPECT_EQ(exchange_amplitude(0.15, 101.0, 1.0, 1.0, {.ir = 1e-3, .uv = 100.0}), 0.0);
}

TEST(ExchangeAmplitude, BelowIrCutoff_EvaluatedAtCutoff) {
    const double at_cutoff = exchange_amplitude(0.15, EXCHANGE_IR_CUTOFF, PLANCK_MASS);
    EXPECT_EQ(exchange_amplitude(0.15, 0.0, PLANCK_MASS), at_cutoff);
    EXPECT_EQ(exchange_amplitude(0.15, 1e-9, PLANCK_MASS), at_cutoff);
    // sinc ≈ 1 at μk = 1.5e-4, so the value is ≈ 1 / ir².
    EXPECT_NEAR(at_cutoff, 1e6, 1e-2);
}

TEST(ExchangeAmplitude, ZeroEnergy_ZeroAmplitude) {
    EXPECT_EQ(exchange_amplitude(0.15, 2.0, 0.0), 0.0);
}

TEST(ExchangeAmplitude, InvalidArguments_Throw) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW((void)exchange_amplitude(0.0, 1.0, 1.0), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, -1.0, 1.0), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, nan, 1.0), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, inf, 1.0), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, 1.0, inf), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, 1.0, 1.0, nan), InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, 1.0, 1.0, 1.0, {.ir = 0.0, .uv = 1.0}),
                 InvalidParameterError);
    EXPECT_THROW((void)exchange_amplitude(0.15, 1.0, 1.0, 1.0, {.ir = 2.0, .uv = 1.0}),
                 InvalidParameterError);
}
