/**
 * @file  bench/bench_response_ratio.cpp
 * @brief Google Benchmark suite for the response and safety-ratio batches.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_Ratio_Scalar / AVX2 / AVX512 / Dispatch
 *   BM_Response_Batch           — response::compute over a span, per formulation
 *   BM_Engine_EvaluateSeries    — full response → assess → classify pipeline
 *
 * Build (CMake):
 *   cmake -DPOLYREG_BENCH=ON ..
 *   cmake --build build --target bench_response_ratio
 *   ./build/bench_response_ratio --benchmark_format=json
 *
 * Throughput units: items/second (doubles processed).
 * Custom counter "Mitems_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

// Kernel detail header (internal, needs src/simd on include path)
#include "simd_batch_detail.hpp"

#include "polyreg/simd/simd_dispatch.hpp"
#include "polyreg/simd/cpu_features.hpp"
#include "polyreg/response.hpp"
#include "polyreg/engine.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N observed quantities spread log-uniformly over [1e-30, 1], every 16th one zero.
static std::vector<double> make_observations(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        v[i] = (i % 16 == 0) ? 0.0 : std::pow(10.0, -30.0 + 30.0 * t);
    }
    return v;
}

/// N momentum-squared values spread log-uniformly over [1e-6, 1e12].
static std::vector<double> make_momenta(std::size_t n) {
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        v[i] = std::pow(10.0, -6.0 + 18.0 * t);
    }
    return v;
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.counters["Mitems_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n) / 1e6,
        benchmark::Counter::kIsRate);
}

// ── Ratio kernels ──────────────────────────────────────────────────────────────

static void BM_Ratio_Scalar(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto obs = make_observations(n);
    std::vector<double> out(n);
    for (auto _ : state) {
        polyreg::simd::detail::compute_ratio_scalar(1.0, obs.data(), n, out.data());
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Ratio_Scalar)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

#if defined(POLYREG_X86_KERNELS)

static void BM_Ratio_Avx2(benchmark::State& state) {
    if (polyreg::simd::detect_simd_level() < polyreg::simd::SimdLevel::AVX2) {
        state.SkipWithError("AVX2 not available on this CPU");
        return;
    }
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto obs = make_observations(n);
    std::vector<double> out(n);
    for (auto _ : state) {
        polyreg::simd::detail::compute_ratio_avx2(1.0, obs.data(), n, out.data());
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Ratio_Avx2)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Ratio_Avx512(benchmark::State& state) {
    if (polyreg::simd::detect_simd_level() < polyreg::simd::SimdLevel::AVX512F) {
        state.SkipWithError("AVX-512F not available on this CPU");
        return;
    }
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto obs = make_observations(n);
    std::vector<double> out(n);
    for (auto _ : state) {
        polyreg::simd::detail::compute_ratio_avx512(1.0, obs.data(), n, out.data());
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Ratio_Avx512)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

#endif // POLYREG_X86_KERNELS

static void BM_Ratio_Dispatch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto obs = make_observations(n);
    for (auto _ : state) {
        auto result = polyreg::simd::compute_ratio_batch(1.0, obs);
        benchmark::DoNotOptimize(result.data());
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Ratio_Dispatch)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Response batch ─────────────────────────────────────────────────────────────

static void BM_Response_Batch(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto f = static_cast<polyreg::Formulation>(state.range(1));
    const auto k2 = make_momenta(n);
    for (auto _ : state) {
        auto result = polyreg::response::compute(0.15, k2, f);
        benchmark::DoNotOptimize(result.data());
        benchmark::ClobberMemory();
    }
    state.SetLabel(polyreg::response::to_string(f));
    set_throughput(state, n);
}
BENCHMARK(BM_Response_Batch)
    ->ArgsProduct({{1024, 65536}, {0, 1, 2}})
    ->Unit(benchmark::kMicrosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_Engine_EvaluateSeries(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto k2 = make_momenta(n);
    const polyreg::core::Engine engine;
    for (auto _ : state) {
        auto points = engine.evaluate_series(k2);
        benchmark::DoNotOptimize(points.data());
        benchmark::ClobberMemory();
    }
    set_throughput(state, n);
}
BENCHMARK(BM_Engine_EvaluateSeries)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
