/// @file src/response/regularized_response.cpp
/// @brief Regularized response G(k) = μ² · sinc²(μ√k²) and its variants.

#include "polyreg/response.hpp"
#include "polyreg/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace polyreg::response {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

void require_scale(double mu) {
    if (!(mu > 0.0) || !std::isfinite(mu)) {
        throw InvalidParameterError("mu", "mu must be > 0");
    }
    // μ² appears as a factor and as the k² = 0 value; it must be representable.
    if (!std::isfinite(mu * mu)) {
        throw InvalidParameterError("mu", "mu must be small enough that mu^2 is finite");
    }
}

void require_momentum(double k_squared, const std::string& name) {
    if (std::isnan(k_squared) || k_squared < 0.0) {
        throw InvalidParameterError("k_squared", name + " must be >= 0");
    }
    if (!std::isfinite(k_squared)) {
        throw InvalidParameterError("k_squared", name + " must be finite");
    }
}

void require_momenta(std::span<const double> k_squared) {
    for (std::size_t i = 0; i < k_squared.size(); ++i) {
        require_momentum(k_squared[i], fmt::format("k_squared[{}]", i));
    }
}

/// Normalised sinc sin(πx)/(πx), used only by the legacy formulation.
[[nodiscard]] double sinc_normalized(double x) noexcept {
    return sinc(std::numbers::pi * x);
}

/// Evaluate a validated (μ, k²) pair. Scalar and batch paths both end here.
[[nodiscard]] double evaluate(double mu, double k_squared, Formulation formulation) noexcept {
    const double x = mu * std::sqrt(k_squared);

    switch (formulation) {
        case Formulation::SineRatio: {
            if (k_squared == 0.0) {
                return mu * mu;
            }
            // Divide before squaring: sin²(x) underflows for subnormal k².
            const double s = std::isfinite(x) ? std::sin(x) : 0.0;
            const double r = s / std::sqrt(k_squared);
            return r * r;
        }
        case Formulation::LegacyNormalizedSinc: {
            if (k_squared == 0.0) {
                return 0.0;
            }
            const double s = sinc_normalized(x);
            return (s * s) / k_squared;
        }
        case Formulation::ScaledSinc:
        default: {
            // (μ²·s)·s with |s| ≤ 1 keeps every partial product ≤ μ².
            const double s  = sinc(x);
            const double m2 = mu * mu;
            return m2 * s * s;
        }
    }
}

} // anonymous namespace

// ─── sinc ─────────────────────────────────────────────────────────────────────

double sinc(double x) noexcept {
    const double ax = std::abs(x);
    if (ax < constants::SINC_SERIES_THRESHOLD) {
        const double x2 = x * x;
        return 1.0 - x2 / 6.0 + (x2 * x2) / 120.0;
    }
    // sin(x)/x → 0 as |x| → ∞; sin(±∞) itself is NaN.
    if (!std::isfinite(x)) {
        return 0.0;
    }
    return std::sin(x) / x;
}

// ─── compute ──────────────────────────────────────────────────────────────────

double compute(double mu, double k_squared) {
    return compute(mu, k_squared, Formulation::ScaledSinc);
}

std::vector<double> compute(double mu, std::span<const double> k_squared) {
    return compute(mu, k_squared, Formulation::ScaledSinc);
}

double compute(double mu, double k_squared, Formulation formulation) {
    require_scale(mu);
    require_momentum(k_squared, "k_squared");
    return evaluate(mu, k_squared, formulation);
}

std::vector<double>
compute(double mu, std::span<const double> k_squared, Formulation formulation) {
    require_scale(mu);
    require_momenta(k_squared);

    std::vector<double> out;
    out.reserve(k_squared.size());
    for (double k2 : k_squared) {
        out.push_back(evaluate(mu, k2, formulation));
    }
    return out;
}

// ─── compute_massive ──────────────────────────────────────────────────────────

double compute_massive(double mu, double k_squared, double mass) {
    require_scale(mu);
    require_momentum(k_squared, "k_squared");
    if (!(mass > 0.0) || !std::isfinite(mass)) {
        throw InvalidParameterError("mass", "mass must be > 0");
    }

    const double s = sinc(mu * std::sqrt(k_squared));
    return (s * s) / (k_squared + mass * mass);
}

// ─── enhancement_over_classical ───────────────────────────────────────────────

double enhancement_over_classical(double mu, double k_squared) {
    require_scale(mu);
    require_momentum(k_squared, "k_squared");
    if (k_squared == 0.0) {
        throw InvalidParameterError("k_squared", "k_squared must be > 0");
    }

    // [sinc²(μ√k²) / k²] / [1 / k²]
    const double s = sinc(mu * std::sqrt(k_squared));
    return s * s;
}

// ─── exchange_amplitude ───────────────────────────────────────────────────────

double exchange_amplitude(double mu, double k, double energy_scale, double coupling,
                          ExchangeCutoffs cutoffs) {
    require_scale(mu);
    if (std::isnan(k) || k < 0.0 || !std::isfinite(k)) {
        throw InvalidParameterError("k", "k must be finite and >= 0");
    }
    if (!std::isfinite(energy_scale)) {
        throw InvalidParameterError("energy_scale", "energy_scale must be finite");
    }
    if (!std::isfinite(coupling)) {
        throw InvalidParameterError("coupling", "coupling must be finite");
    }
    if (!(cutoffs.ir > 0.0) || !(cutoffs.uv > cutoffs.ir) || !std::isfinite(cutoffs.uv)) {
        throw InvalidParameterError("cutoffs", "cutoffs must satisfy 0 < ir < uv");
    }

    if (k > cutoffs.uv) {
        return 0.0;
    }
    const double k_eff = std::max(k, cutoffs.ir);

    const double r      = sinc(mu * k_eff) / k_eff;
    const double energy = energy_scale / constants::PLANCK_MASS;
    return coupling * (energy * energy) * (r * r);
}

// ─── spectrum ─────────────────────────────────────────────────────────────────

std::vector<SpectrumPoint>
spectrum(double mu, double k_min, double k_max, std::size_t points) {
    require_scale(mu);
    if (!(k_min > 0.0) || !std::isfinite(k_min)) {
        throw InvalidParameterError("k_min", "k_min must be > 0");
    }
    if (!(k_max > k_min) || !std::isfinite(k_max)) {
        throw InvalidParameterError("k_max", "k_max must be finite and > k_min");
    }
    if (!std::isfinite(k_max * k_max)) {
        throw InvalidParameterError("k_max", "k_max must be small enough that k_max^2 is finite");
    }
    if (points < 2) {
        throw InvalidParameterError("points", "points must be >= 2");
    }

    const double log_min = std::log10(k_min);
    const double log_max = std::log10(k_max);
    const double step    = (log_max - log_min) / static_cast<double>(points - 1);

    std::vector<SpectrumPoint> out;
    out.reserve(points);
    for (std::size_t i = 0; i < points; ++i) {
        double k = std::pow(10.0, log_min + step * static_cast<double>(i));
        // Pin the endpoints so the sweep covers exactly [k_min, k_max].
        if (i == 0)          k = k_min;
        if (i == points - 1) k = k_max;

        const double k2 = k * k;
        out.push_back(SpectrumPoint{k2, evaluate(mu, k2, Formulation::ScaledSinc)});
    }
    return out;
}

// ─── check_uv_finiteness ──────────────────────────────────────────────────────

UvFinitenessReport check_uv_finiteness(double mu, double k_max) {
    require_scale(mu);
    if (!(k_max > constants::UV_PROBE_K_MIN) || !std::isfinite(k_max)) {
        throw InvalidParameterError(
            "k_max", fmt::format("k_max must be finite and > {:g}", constants::UV_PROBE_K_MIN));
    }

    const auto samples = spectrum(mu, constants::UV_PROBE_K_MIN, k_max,
                                  constants::UV_PROBE_POINTS);

    UvFinitenessReport report{
        .finite            = true,
        .max_response      = 0.0,
        .suppression_ratio = 0.0,
        .samples           = samples.size(),
    };

    for (const auto& p : samples) {
        if (!std::isfinite(p.response)) {
            report.finite = false;
            continue;
        }
        if (p.response > report.max_response) {
            report.max_response = p.response;
        }
    }

    const double first = samples.front().response;
    const double last  = samples.back().response;
    if (first != 0.0 && std::isfinite(first) && std::isfinite(last)) {
        report.suppression_ratio = last / first;
    }
    return report;
}

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Formulation formulation) noexcept {
    switch (formulation) {
        case Formulation::ScaledSinc:           return "scaled";
        case Formulation::SineRatio:            return "sine";
        case Formulation::LegacyNormalizedSinc: return "legacy";
        default:                                return "unknown";
    }
}

} // namespace polyreg::response
