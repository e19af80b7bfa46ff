/**
 * @file  bench/bench_formula.cpp
 * @brief Google Benchmark suite for formula evaluation and validation.
 *
 * Benchmarks
 * ----------
 *   BM_Formula_Evaluate        one Prediction from a history of N periods
 *   BM_Trend_Calculate         full-league recomputation, 1 vs 4 workers
 *   BM_Metrics_Compute         all statistics over N pairs
 *   BM_Validation_WalkForward  walk-forward backtest over a 20-period season
 *
 * Build (CMake):
 *   cmake --build build --target bench_formula
 *   ./build/bench_formula --benchmark_format=json
 *
 * Throughput units: items/second (predictions or pairs processed).
 */

#include "benchmark/benchmark.h"

#include "fvh/formula.hpp"
#include "fvh/metrics.hpp"
#include "fvh/snapshot_store.hpp"
#include "fvh/trend.hpp"
#include "fvh/validation.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic snapshot for player i in period p.
static fvh::RawSnapshot make_snapshot(std::size_t i, fvh::Period p) {
    const auto pp = static_cast<std::size_t>(p);
    fvh::RawSnapshot s;
    s.player_id          = fmt::format("p{:04d}", i);
    s.period             = p;
    s.position           = static_cast<fvh::Position>(i % 4);
    s.points             = static_cast<double>(2 + i % 7 + (i * 7 + pp * 3) % 5);
    s.minutes            = 90.0;
    s.shot_rate          = 0.5 + 0.1 * static_cast<double>((i + pp) % 4);
    s.shot_rate_baseline = 0.6;
    s.price              = 4.5 + 0.5 * static_cast<double>(i % 12);
    s.fixture_difficulty = static_cast<double>((i + 2 * pp) % 11) - 5.0;
    s.starter_status     = fvh::StarterStatus::Confirmed;
    s.prior_baseline     = 4.0 + static_cast<double>(i % 5);
    return s;
}

static void fill(fvh::store::InMemorySnapshotStore& store, std::size_t players, fvh::Period periods) {
    for (std::size_t i = 0; i < players; ++i) {
        for (fvh::Period p = 1; p <= periods; ++p) store.append(make_snapshot(i, p));
    }
}

// ── Formula ──────────────────────────────────────────────────────────────────

static void BM_Formula_Evaluate(benchmark::State& state) {
    const auto periods = static_cast<fvh::Period>(state.range(0));
    fvh::PlayerHistory history{.player_id = "p0001", .snapshots = {}};
    for (fvh::Period p = 1; p <= periods; ++p) history.snapshots.push_back(make_snapshot(1, p));
    const fvh::formula::FormulaEngine engine(fvh::ParameterSet::defaults());

    for (auto _ : state) {
        auto prediction = engine.evaluate(history, periods);
        benchmark::DoNotOptimize(prediction);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Formula_Evaluate)->RangeMultiplier(2)->Range(4, 64)->Unit(benchmark::kMicrosecond);

// ── Trend ────────────────────────────────────────────────────────────────────

static void BM_Trend_Calculate(benchmark::State& state) {
    fvh::store::InMemorySnapshotStore store;
    fill(store, 600, 10);
    const fvh::trend::TrendAnalysisEngine engine(
        store, fvh::trend::TrendConfig{.workers = static_cast<std::size_t>(state.range(0))});

    std::size_t predictions = 0;
    for (auto _ : state) {
        auto run = engine.calculate(fvh::ParameterSet::defaults(), 1, 10);
        predictions += run.predictions.size();
        benchmark::DoNotOptimize(run);
    }
    state.SetItemsProcessed(static_cast<int64_t>(predictions));
}
BENCHMARK(BM_Trend_Calculate)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond);

// ── Metrics ──────────────────────────────────────────────────────────────────

static void BM_Metrics_Compute(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<fvh::validation::PredictionOutcome> pairs(n);
    for (std::size_t i = 0; i < n; ++i) {
        pairs[i].prediction.player_id   = fmt::format("p{:06d}", i);
        pairs[i].prediction.final_value = static_cast<double>((i * 37) % 101) / 10.0;
        pairs[i].actual                 = static_cast<double>((i * 53) % 97) / 10.0;
    }

    for (auto _ : state) {
        auto m = fvh::validation::MetricsCalculator::compute(pairs);
        benchmark::DoNotOptimize(m);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Metrics_Compute)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Validation ───────────────────────────────────────────────────────────────

static void BM_Validation_WalkForward(benchmark::State& state) {
    fvh::store::InMemorySnapshotStore store;
    fill(store, static_cast<std::size_t>(state.range(0)), 20);
    const fvh::validation::ValidationEngine engine(store);

    for (auto _ : state) {
        auto wf = engine.walk_forward(fvh::ParameterSet::defaults(), {1, 20});
        benchmark::DoNotOptimize(wf);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0) * 19);
}
BENCHMARK(BM_Validation_WalkForward)->Arg(100)->Arg(400)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
