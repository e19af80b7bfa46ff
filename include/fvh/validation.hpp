#pragma once

/// @file include/fvh/validation.hpp
/// @brief Backtesting, grid search, cross-validation and robustness checks.
///
/// # Module: Validation Engine
///
/// ## Responsibility
/// Measure how well a ParameterSet predicts realized points, using only
/// information available before each tested period:
///   - run_backtest:   train on earlier periods, predict one test period
///   - walk_forward:   backtest every period of a range in turn
///   - optimize:       grid search over ParameterSets, persisted per entry
///   - cross_validate: consecutive folds, forward-only training
///   - stratify:       metrics per position, fixture bucket and price tier
///   - compare:        two ParameterSets over the same backtest
///
/// ## Guarantees
/// - The realized points, minutes and shot rate of a tested period never
///   reach its prediction
/// - Training periods at or after the test period throw LookaheadViolation
/// - Grid search skips entries already in the ResultStore under the same
///   sampling and metric settings
/// - Player sampling is reproducible from the recorded seed
///
/// ## NOT Responsible For
/// - Presentation (the CLI formats reports)

#include "fvh/metrics.hpp"
#include "fvh/optimization.hpp"
#include "fvh/parameters.hpp"
#include "fvh/result_store.hpp"
#include "fvh/snapshot_store.hpp"
#include "fvh/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fvh::validation {

// ─── Types ────────────────────────────────────────────────────────────────────

struct BacktestResult {
    Period                         test_period = 0;
    std::vector<PredictionOutcome> pairs;
    std::size_t                    evaluated = 0;  ///< Predictions made
    std::size_t                    excluded  = 0;  ///< Predictions with no realized outcome
    std::size_t                    skipped   = 0;  ///< Players with nothing to evaluate
};

/// Several test periods folded together.
struct WalkForwardResult {
    std::vector<PredictionOutcome> pairs;
    std::size_t                    evaluated = 0;
    std::size_t                    excluded  = 0;
    std::size_t                    skipped   = 0;
    std::vector<Period>            tested_periods;
};

struct CrossValidationConfig {
    std::size_t   fold_size         = 2;
    std::size_t   min_train_periods = 2;
    MetricsConfig metrics{};
};

struct FoldResult {
    std::vector<Period> test_periods;
    ValidationMetrics   metrics;
};

struct CrossValidationReport {
    std::vector<FoldResult> folds;
    std::size_t skipped_folds    = 0;  ///< Too few earlier periods to train on
    std::size_t aggregated_folds = 0;  ///< Folds with sufficient metrics
    double mean_rmse     = 0.0;
    double std_rmse      = 0.0;
    double mean_mae      = 0.0;
    double std_mae       = 0.0;
    double mean_spearman = 0.0;
    double std_spearman  = 0.0;

    [[nodiscard]] std::string to_string() const;
};

/// Metrics for one slice of the pairs.
struct Stratum {
    std::string       dimension;  ///< "position", "fixture" or "price"
    std::string       label;
    ValidationMetrics metrics;
};

struct ComparisonReport {
    std::string       name_a;
    std::string       name_b;
    ValidationMetrics a;
    ValidationMetrics b;

    /// b - a; negative error deltas mean b is more accurate.
    [[nodiscard]] double rmse_delta() const noexcept { return b.rmse - a.rmse; }
    [[nodiscard]] double mae_delta() const noexcept { return b.mae - a.mae; }
    [[nodiscard]] double spearman_delta() const noexcept { return b.spearman - a.spearman; }
    [[nodiscard]] double precision_delta() const noexcept { return b.precision_at_k - a.precision_at_k; }

    [[nodiscard]] std::string to_string() const;
};

// ─── ValidationEngine ─────────────────────────────────────────────────────────

/// Usage
/// -----
/// ```cpp
/// store::InMemorySnapshotStore snapshots;
/// snapshots.append_all(report.snapshots);
/// ValidationEngine engine(snapshots);
/// auto wf = engine.walk_forward(ParameterSet::defaults(), {1, 20});
/// fmt::print("{}\n", engine.compute_metrics(wf.pairs).to_string());
/// ```
class ValidationEngine {
public:
    /// The store must outlive the engine.
    explicit ValidationEngine(const store::RawSnapshotStore& store, MetricsConfig metrics = {});

    /// Train on `train_periods`, predict `test_period`. The test period's
    /// snapshot supplies context (price, fixture, starter, shot-rate
    /// baseline) with its realized points removed; minutes and the current
    /// shot rate come from the latest training snapshot. With `players`
    /// empty, every player with a
    /// snapshot in the test period is evaluated.
    ///
    /// @throws LookaheadViolation if any training period >= test_period.
    /// @throws InvalidParameterSet
    [[nodiscard]] BacktestResult run_backtest(std::span<const Period> train_periods,
                                              Period test_period,
                                              const ParameterSet& params,
                                              std::span<const PlayerId> players = {}) const;

    /// Backtest every stored period in `range` that has at least
    /// `min_train_periods` earlier stored periods in range, training on all of
    /// them. With `sample_size` > 0, at most that many players per period are
    /// drawn using a generator seeded from `seed` and the period.
    [[nodiscard]] WalkForwardResult walk_forward(const ParameterSet& params,
                                                 PeriodRange range,
                                                 std::size_t min_train_periods = 1,
                                                 std::size_t sample_size = 0,
                                                 std::uint64_t seed = 0) const;

    [[nodiscard]] ValidationMetrics compute_metrics(std::span<const PredictionOutcome> pairs) const;

    /// Evaluate every grid combination over `range`, persisting each entry to
    /// `results` as soon as it is computed and reusing entries already there.
    ///
    /// @throws InvalidParameterSet before any work if a combination is invalid.
    [[nodiscard]] OptimizationRun optimize(const ParameterGrid& grid,
                                           PeriodRange range,
                                           store::ResultStore& results,
                                           const ParameterSet& base = ParameterSet::defaults(),
                                           const OptimizationConfig& config = {}) const;

    /// Consecutive folds of `config.fold_size` periods. Each fold trains on
    /// the periods before it; folds with fewer than
    /// `config.min_train_periods` of them are skipped and counted.
    [[nodiscard]] CrossValidationReport cross_validate(std::span<const Period> periods,
                                                       const ParameterSet& params,
                                                       const CrossValidationConfig& config = {}) const;

    /// Metrics per position, fixture-difficulty bucket and price tier.
    /// Empty strata are left out.
    [[nodiscard]] std::vector<Stratum> stratify(std::span<const PredictionOutcome> pairs) const;

    /// Walk-forward both sets over `range` with identical players.
    [[nodiscard]] ComparisonReport compare(const ParameterSet& a,
                                           const ParameterSet& b,
                                           PeriodRange range,
                                           std::size_t min_train_periods = 1) const;

    /// The `n` pairs with the highest predicted value (ties by player, period).
    [[nodiscard]] static std::vector<PredictionOutcome>
    top_predictions(std::span<const PredictionOutcome> pairs, std::size_t n);

    /// The `n` pairs with the highest realized points (ties by player, period).
    [[nodiscard]] static std::vector<PredictionOutcome>
    top_actuals(std::span<const PredictionOutcome> pairs, std::size_t n);

    /// Stratum labels used by stratify().
    [[nodiscard]] static std::string fixture_bucket(const Prediction& p);
    [[nodiscard]] static std::string price_tier(const Prediction& p);

private:
    const store::RawSnapshotStore& store_;
    MetricsConfig                  metrics_;
};

} // namespace fvh::validation
