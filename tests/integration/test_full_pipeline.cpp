/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests over the whole valuation pipeline.
///
/// These tests exercise the complete path:
///   CSV → DataLoader → InMemorySnapshotStore → TrendAnalysisEngine →
///   ValidationEngine (walk-forward, grid search into a FileResultStore,
///   cross-validation, stratification)

#include "fvh/data_loader.hpp"
#include "fvh/records.hpp"
#include "fvh/result_store.hpp"
#include "fvh/snapshot_store.hpp"
#include "fvh/trend.hpp"
#include "fvh/validation.hpp"
#include "support/league.hpp"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <vector>

using namespace fvh;
using namespace fvh::validation;
using fvh::core::DataLoader;
using fvh::store::FileResultStore;
using fvh::store::InMemorySnapshotStore;
using fvh::trend::TrendAnalysisEngine;
using fvh::trend::TrendConfig;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

std::string opt(const std::optional<double>& v) {
    return v ? fmt::format("{}", *v) : std::string{};
}

/// The synthetic league written out in the loader's CSV format.
std::string league_csv(std::size_t players, Period periods) {
    std::string csv =
        "player_id,period,position,points,minutes,shot_rate,shot_rate_baseline,price,"
        "fixture_difficulty,starter_status,starter_override,prior_baseline,revision\n";
    for (std::size_t i = 0; i < players; ++i) {
        for (Period p = 1; p <= periods; ++p) {
            const RawSnapshot s = fvh::testing::league_snapshot(i, p);
            csv += fmt::format("{},{},{},{},{},{},{},{},{},{},,{},{}\n",
                               s.player_id, s.period, to_string(s.position), opt(s.points),
                               s.minutes, opt(s.shot_rate), opt(s.shot_rate_baseline),
                               opt(s.price), opt(s.fixture_difficulty),
                               to_string(*s.starter_status), opt(s.prior_baseline), s.revision);
        }
    }
    return csv;
}

class FullPipeline : public ::testing::Test {
protected:
    void SetUp() override {
        const auto report = DataLoader::parse_csv_string(league_csv(16, 10));
        ASSERT_EQ(report.skipped_rows, 0u);
        store_.append_all(report.snapshots);
    }

    InMemorySnapshotStore store_;
};

} // anonymous namespace

// ─── Tests ────────────────────────────────────────────────────────────────────

TEST_F(FullPipeline, LoaderReproducesTheLeague) {
    EXPECT_EQ(store_.size(), 16u * 10u);
    const auto history = store_.player_history(fvh::testing::player_name(3), 10);
    ASSERT_EQ(history.snapshots.size(), 10u);
    EXPECT_EQ(history.snapshots[4], fvh::testing::league_snapshot(3, 5));
}

TEST_F(FullPipeline, TrendThenValidate) {
    const TrendAnalysisEngine trend(store_, TrendConfig{.workers = 3});
    const auto run = trend.calculate(ParameterSet::defaults(), 1, 10);
    EXPECT_EQ(run.succeeded, 160u);
    EXPECT_EQ(run.failed, 0u);
    for (const auto& p : run.predictions) {
        EXPECT_GT(p.final_value, 0.0);
        EXPECT_LE(p.final_value, p.blended_baseline * ParameterSet::defaults().global_cap + 1e-12);
    }

    const ValidationEngine engine(store_);
    const auto wf = engine.walk_forward(ParameterSet::defaults(), PeriodRange{1, 10}, 2);
    const auto metrics = engine.compute_metrics(wf.pairs);
    EXPECT_TRUE(metrics.sufficient);
    EXPECT_EQ(metrics.sample_size, 16u * 8u);
    EXPECT_GE(metrics.rmse, metrics.mae);
    // Skill dominates the synthetic points, so rankings must carry signal.
    EXPECT_GT(metrics.spearman, 0.0);
}

TEST_F(FullPipeline, GridSearchSurvivesRestart) {
    const auto path = std::filesystem::temp_directory_path() / "fvh_pipeline_results.tsv";
    std::filesystem::remove(path);

    const ParameterGrid grid{
        .decay_rates         = {0.8, 0.9},
        .adaptation_horizons = {10},
        .form_caps           = {{0.5, 2.0}, {0.6, 1.8}},
        .ratio_caps          = {{0.5, 2.5}},
    };
    const ValidationEngine engine(store_);

    OptimizationRun first;
    {
        FileResultStore results(path);
        first = engine.optimize(grid, PeriodRange{1, 10}, results);
        EXPECT_EQ(first.computed, 4u);
    }
    {
        FileResultStore results(path);
        EXPECT_EQ(results.entries().size(), 4u);
        const auto second = engine.optimize(grid, PeriodRange{1, 10}, results);
        EXPECT_EQ(second.reused, 4u);
        EXPECT_EQ(second.computed, 0u);
        EXPECT_EQ(second.entries, first.entries);
        ASSERT_TRUE(second.best().has_value());
        EXPECT_EQ(second.best()->key(), first.best()->key());
    }
    std::filesystem::remove(path);
}

TEST_F(FullPipeline, CrossValidateAndStratify) {
    const ValidationEngine engine(store_);
    const auto periods = store_.periods();
    const auto report = engine.cross_validate(periods, ParameterSet::defaults(),
                                              CrossValidationConfig{.fold_size = 2, .min_train_periods = 2});
    EXPECT_EQ(report.folds.size(), 4u);
    EXPECT_EQ(report.skipped_folds, 1u);
    EXPECT_EQ(report.aggregated_folds, 4u);

    const auto wf = engine.walk_forward(ParameterSet::defaults(), PeriodRange{1, 10});
    const auto strata = engine.stratify(wf.pairs);
    EXPECT_FALSE(strata.empty());
    for (const auto& s : strata) {
        EXPECT_GT(s.metrics.sample_size, 0u);
    }
}

TEST_F(FullPipeline, ParameterFileDrivesTheSameResults) {
    const auto path = std::filesystem::temp_directory_path() / "fvh_pipeline_params.tsv";
    ParameterSet tuned = ParameterSet::defaults();
    tuned.name       = "tuned";
    tuned.decay_rate = 0.9;
    records::save_parameter_file(path, tuned);
    const ParameterSet loaded = records::load_parameter_file(path);
    std::filesystem::remove(path);

    const TrendAnalysisEngine trend(store_);
    EXPECT_EQ(trend.calculate(loaded, 4, 6).predictions, trend.calculate(tuned, 4, 6).predictions);
}
