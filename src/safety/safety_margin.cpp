/// @file src/safety/safety_margin.cpp
/// @brief Safety-margin ratio, graded classification and positive-energy check.

#include "polyreg/safety.hpp"
#include "polyreg/errors.hpp"
#include "polyreg/simd/simd_dispatch.hpp"

#include <Eigen/Eigenvalues>
#include <fmt/format.h>

#include <cmath>

namespace polyreg::safety {

// ─── Internal helpers ─────────────────────────────────────────────────────────

namespace {

void require_margin(double margin_constant) {
    if (!(margin_constant > 0.0) || !std::isfinite(margin_constant)) {
        throw InvalidParameterError("margin_constant", "margin_constant must be > 0");
    }
}

void require_threshold(double threshold) {
    if (std::isnan(threshold)) {
        throw InvalidParameterError("threshold", "threshold must not be NaN");
    }
}

void require_finite_matrix(const StressEnergyMatrix& m, const char* name) {
    if (!m.allFinite()) {
        throw InvalidParameterError(name, fmt::format("{} must have finite entries", name));
    }
}

} // anonymous namespace

// ─── assess ───────────────────────────────────────────────────────────────────

SafetyAssessment
assess(double margin_constant, double observed_quantity, double threshold) {
    require_margin(margin_constant);
    if (!std::isfinite(observed_quantity)) {
        throw InvalidParameterError("observed_quantity", "observed_quantity must be finite");
    }
    require_threshold(threshold);

    // One-element batch: the scalar and batch forms share the kernel.
    const double observed[1] = {observed_quantity};
    const double ratio = simd::compute_ratio_batch(margin_constant, observed).front();
    return SafetyAssessment{ratio, ratio > threshold};
}

std::vector<SafetyAssessment>
assess(double                  margin_constant,
       std::span<const double> observed_quantities,
       double                  threshold) {
    require_margin(margin_constant);
    for (std::size_t i = 0; i < observed_quantities.size(); ++i) {
        if (!std::isfinite(observed_quantities[i])) {
            throw InvalidParameterError(
                "observed_quantity",
                fmt::format("observed_quantity[{}] must be finite", i));
        }
    }
    require_threshold(threshold);

    const auto ratios = simd::compute_ratio_batch(margin_constant, observed_quantities);

    std::vector<SafetyAssessment> out;
    out.reserve(ratios.size());
    for (double r : ratios) {
        out.push_back(SafetyAssessment{r, r > threshold});
    }
    return out;
}

// ─── classify ─────────────────────────────────────────────────────────────────

SafetyLevel classify(double ratio, double safe_threshold) {
    if (std::isnan(ratio)) {
        throw InvalidParameterError("ratio", "ratio must not be NaN");
    }
    if (std::isnan(safe_threshold)) {
        throw InvalidParameterError("safe_threshold", "safe_threshold must not be NaN");
    }

    if (ratio >= safe_threshold)          return SafetyLevel::Safe;
    if (ratio >= constants::CAUTION_RATIO) return SafetyLevel::Caution;
    if (ratio >= constants::WARNING_RATIO) return SafetyLevel::Warning;
    return SafetyLevel::Emergency;
}

// ─── assess_exposure ──────────────────────────────────────────────────────────

SafetyAssessment assess_exposure(double exposure, double biological_margin) {
    if (!(biological_margin > 0.0) || !std::isfinite(biological_margin)) {
        throw InvalidParameterError("biological_margin", "biological_margin must be > 0");
    }
    if (!std::isfinite(exposure)) {
        throw InvalidParameterError("exposure", "exposure must be finite");
    }
    return assess(1.0 / biological_margin, exposure, biological_margin);
}

// ─── Positive energy ──────────────────────────────────────────────────────────

StressEnergyMatrix stress_energy(const FieldConfiguration& field) {
    require_finite_matrix(field, "field");
    return StressEnergyMatrix::Identity() * field.squaredNorm();
}

bool satisfies_positive_energy(const StressEnergyMatrix& tensor, double tolerance) {
    require_finite_matrix(tensor, "tensor");

    // SelfAdjointEigenSolver reads only one triangle; symmetrise explicitly
    // so an asymmetric input is judged by its symmetric part.
    const StressEnergyMatrix sym = 0.5 * (tensor + tensor.transpose());
    Eigen::SelfAdjointEigenSolver<StressEnergyMatrix> solver(sym, Eigen::EigenvaluesOnly);
    if (solver.info() != Eigen::Success) {
        return false;
    }
    return solver.eigenvalues().minCoeff() >= tolerance;
}

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(SafetyLevel level) noexcept {
    switch (level) {
        case SafetyLevel::Safe:      return "SAFE";
        case SafetyLevel::Caution:   return "CAUTION";
        case SafetyLevel::Warning:   return "WARNING";
        case SafetyLevel::Emergency: return "EMERGENCY";
        default:                     return "UNKNOWN";
    }
}

} // namespace polyreg::safety
