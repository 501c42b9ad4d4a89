/**
 * @file  simd_dispatch.cpp
 * @brief Routes compute_ratio_batch to the widest available kernel.
 *
 * Module:  src/simd/
 *
 * Dispatch strategy
 * -----------------
 *   detect_simd_level() is read once and a function pointer is cached:
 *
 *       AVX512F → detail::compute_ratio_avx512
 *       AVX2    → detail::compute_ratio_avx2
 *       *       → detail::compute_ratio_scalar
 *
 *   Builds without POLYREG_X86_KERNELS always take the scalar kernel.
 */

#include "polyreg/simd/simd_dispatch.hpp"
#include "simd_batch_detail.hpp"

#include <cstddef>
#include <vector>

namespace polyreg::simd {

namespace {

using RatioKernelFn = void(*)(double, const double*, std::size_t, double*) noexcept;

[[nodiscard]] RatioKernelFn select_ratio_kernel() noexcept {
#if defined(POLYREG_X86_KERNELS)
    switch (detect_simd_level()) {
        case SimdLevel::AVX512F: return detail::compute_ratio_avx512;
        case SimdLevel::AVX2:    return detail::compute_ratio_avx2;
        default:                 return detail::compute_ratio_scalar;
    }
#else
    return detail::compute_ratio_scalar;
#endif
}

[[nodiscard]] SimdLevel effective_level() noexcept {
#if defined(POLYREG_X86_KERNELS)
    const SimdLevel level = detect_simd_level();
    return level >= SimdLevel::AVX2 ? level : SimdLevel::SCALAR;
#else
    return SimdLevel::SCALAR;
#endif
}

} // anonymous namespace

// ── compute_ratio_batch ───────────────────────────────────────────────────────

std::vector<double>
compute_ratio_batch(double margin, std::span<const double> observed) noexcept {
    std::vector<double> out(observed.size());
    if (observed.empty()) return out;

    static const RatioKernelFn kernel = select_ratio_kernel();
    kernel(margin, observed.data(), observed.size(), out.data());
    return out;
}

// ── RatioCalculator ───────────────────────────────────────────────────────────

RatioCalculator::RatioCalculator(double margin) noexcept
    : margin_(margin)
    , simd_level_(effective_level())
{}

std::vector<double>
RatioCalculator::compute(std::span<const double> observed) const noexcept {
    return compute_ratio_batch(margin_, observed);
}

double RatioCalculator::margin() const noexcept { return margin_; }

SimdLevel RatioCalculator::simd_level() const noexcept { return simd_level_; }

} // namespace polyreg::simd
