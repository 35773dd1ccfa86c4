/**
 * @file  bench/bench_chart.cpp
 * @brief Google Benchmark suite for chart computation and harmonic correlation.
 *
 * Benchmarks
 * ----------
 *   BM_Resolve              : string parsing, Julian day and location lookup
 *   BM_BodyPositions        : ten planets plus nodes for one moment
 *   BM_FindAspects          : all 45 planet pairs
 *   BM_ComputeChart         : full pipeline, birth strings to Chart
 *   BM_Correlate            : aspects × partials difference matrix and matching
 *
 * Build (CMake):
 *   cmake -DNATAL_BENCH=ON ..
 *   cmake --build build --target bench_chart
 *   ./build/bench_chart --benchmark_format=json
 *
 * Throughput units: items/second (charts, or matrix cells for BM_Correlate).
 */

#include "benchmark/benchmark.h"

#include "natal/aspects.hpp"
#include "natal/engine.hpp"
#include "natal/ephemeris.hpp"
#include "natal/harmonics.hpp"
#include "natal/temporal.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace natal;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const temporal::BirthMoment SAMPLE{"1990-03-15", "2:30 pm", "New York, USA"};

/// A synthetic harmonic series of N partials with ratios spread over [1, 2].
static harmonics::SongHarmonicSeries make_series(std::size_t n) {
    harmonics::SongHarmonicSeries series{.fundamental_hz = 261.63, .partials = {}};
    series.partials.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double ratio = 1.0 + static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        series.partials.push_back(harmonics::HarmonicPartial{
            .harmonic_number      = static_cast<int>(i) + 1,
            .frequency_hz         = 261.63 * ratio,
            .amplitude            = 1.0 / static_cast<double>(i + 1),
            .ratio_to_fundamental = ratio,
        });
    }
    return series;
}

static core::ChartEngine make_engine() {
    spdlog::set_level(spdlog::level::off);
    return core::ChartEngine(core::EngineConfig{});
}

// ── Pipeline stages ────────────────────────────────────────────────────────────

static void BM_Resolve(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(temporal::TemporalResolver::resolve(SAMPLE));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Resolve)->Unit(benchmark::kMicrosecond);

static void BM_BodyPositions(benchmark::State& state) {
    const auto moment = temporal::TemporalResolver::resolve(SAMPLE);
    if (!moment) {
        state.SkipWithError("sample moment failed to resolve");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(ephemeris::BodyPositionCalculator::compute(*moment));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_BodyPositions)->Unit(benchmark::kMicrosecond);

static void BM_FindAspects(benchmark::State& state) {
    const auto moment = temporal::TemporalResolver::resolve(SAMPLE);
    if (!moment) {
        state.SkipWithError("sample moment failed to resolve");
        return;
    }
    const auto set = ephemeris::BodyPositionCalculator::compute(*moment);
    for (auto _ : state) {
        benchmark::DoNotOptimize(aspects::AspectEngine::find_aspects(set.planets));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FindAspects)->Unit(benchmark::kMicrosecond);

static void BM_ComputeChart(benchmark::State& state) {
    const auto engine = make_engine();
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.compute_chart(SAMPLE));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ComputeChart)->Unit(benchmark::kMicrosecond);

// ── Harmonic correlation ───────────────────────────────────────────────────────

static void BM_Correlate(benchmark::State& state) {
    const auto engine = make_engine();
    const auto chart  = engine.compute_chart(SAMPLE);
    if (!chart) {
        state.SkipWithError("sample chart failed to compute");
        return;
    }
    const std::size_t n      = static_cast<std::size_t>(state.range(0));
    const auto        series = make_series(n);

    for (auto _ : state) {
        benchmark::DoNotOptimize(harmonics::HarmonicMapper::correlate(chart->aspects, series));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(n * chart->aspects.size()));
}
BENCHMARK(BM_Correlate)->RangeMultiplier(4)->Range(4, 1024)->Unit(benchmark::kMicrosecond);
