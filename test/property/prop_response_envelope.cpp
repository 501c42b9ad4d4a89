/**
 * @file  prop_response_envelope.cpp
 * @brief Property: ∀ μ > 0, k² ≥ 0:  0 ≤ G(μ, k²) ≤ μ²  and  G ≤ 1/k²
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_response_envelope
 *
 * Mathematical basis:
 *   G = μ²·sinc²(μ√k²),  |sinc(x)| ≤ 1,  |sin x| ≤ 1
 *   ⇒ G ≤ μ²  and  G = sin²(μ√k²)/k² ≤ 1/k²
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>

#include "polyreg/response.hpp"

using namespace polyreg::response;

namespace {

/// Map an arbitrary double to a positive scale in [1e-3, 10].
double to_scale(double raw) {
    return 1e-3 + (std::tanh(raw) + 1.0) * 0.5 * (10.0 - 1e-3);
}

/// Map an arbitrary double to k² spread over [0, 1e30].
double to_k_squared(double raw) {
    if (!std::isfinite(raw)) return 0.0;
    return std::max(0.0, std::pow(10.0, std::fmod(std::abs(raw), 60.0) - 30.0) - 1e-30);
}

} // anonymous namespace

int main() {
    // ── Property 1: 0 ≤ G ≤ μ² ───────────────────────────────────────────────
    rc::check(
        "response_envelope: 0 <= G <= mu^2",
        [](double raw_mu, double raw_k2) {
            RC_PRE(std::isfinite(raw_mu));
            const double mu = to_scale(raw_mu);
            const double k2 = to_k_squared(raw_k2);
            const double g  = compute(mu, k2);
            RC_ASSERT(std::isfinite(g));
            RC_ASSERT(g >= 0.0);
            RC_ASSERT(g <= mu * mu * (1.0 + 1e-15));
        }
    );

    // ── Property 2: G ≤ 1/k² (UV suppression) ────────────────────────────────
    rc::check(
        "response_envelope: G <= 1/k^2 for k^2 > 0",
        [](double raw_mu, double raw_k2) {
            RC_PRE(std::isfinite(raw_mu));
            const double mu = to_scale(raw_mu);
            const double k2 = to_k_squared(raw_k2);
            RC_PRE(k2 > 0.0);
            const double g = compute(mu, k2);
            RC_ASSERT(g <= (1.0 / k2) * (1.0 + 1e-12));
        }
    );

    // ── Property 3: G(μ, 0) = μ² exactly ─────────────────────────────────────
    rc::check(
        "response_envelope: G(mu, 0) == mu^2",
        [](double raw_mu) {
            RC_PRE(std::isfinite(raw_mu));
            const double mu = to_scale(raw_mu);
            RC_ASSERT(compute(mu, 0.0) == mu * mu);
        }
    );

    return 0;
}
