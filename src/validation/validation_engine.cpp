/// @file src/validation/validation_engine.cpp
/// @brief ValidationEngine: leak-free backtests, walk-forward runs,
///        side-by-side comparison and top-N listings.

#include "fvh/validation.hpp"
#include "fvh/errors.hpp"
#include "fvh/formula.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <random>
#include <set>
#include <tuple>

namespace fvh::validation {

namespace {

/// Ordering for top-N listings: value descending, then (player, period).
std::vector<PredictionOutcome> top_by(std::span<const PredictionOutcome> pairs,
                                      std::size_t n,
                                      bool by_prediction) {
    std::vector<PredictionOutcome> sorted(pairs.begin(), pairs.end());
    std::sort(sorted.begin(), sorted.end(), [by_prediction](const auto& a, const auto& b) {
        const double va = by_prediction ? a.prediction.final_value : a.actual;
        const double vb = by_prediction ? b.prediction.final_value : b.actual;
        if (va != vb) return va > vb;
        return std::tie(a.prediction.player_id, a.prediction.period) <
               std::tie(b.prediction.player_id, b.prediction.period);
    });
    sorted.resize(std::min(n, sorted.size()));
    return sorted;
}

} // anonymous namespace

// ─── ComparisonReport ─────────────────────────────────────────────────────────

std::string ComparisonReport::to_string() const {
    return fmt::format(
        "{:<14} {:>18} {:>18} {:>10}\n"
        "{:<14} {:>18} {:>18} {:>10}\n"
        "{:<14} {:>18.4f} {:>18.4f} {:>+10.4f}\n"
        "{:<14} {:>18.4f} {:>18.4f} {:>+10.4f}\n"
        "{:<14} {:>18.4f} {:>18.4f} {:>+10.4f}\n"
        "{:<14} {:>18.4f} {:>18.4f} {:>+10.4f}",
        "Metric", name_a, name_b, "Delta",
        "Sample", a.sample_size, b.sample_size, "",
        "RMSE", a.rmse, b.rmse, rmse_delta(),
        "MAE", a.mae, b.mae, mae_delta(),
        "Spearman", a.spearman, b.spearman, spearman_delta(),
        fmt::format("Precision@{}", b.k), a.precision_at_k, b.precision_at_k, precision_delta());
}

// ─── ValidationEngine ─────────────────────────────────────────────────────────

ValidationEngine::ValidationEngine(const store::RawSnapshotStore& store, MetricsConfig metrics)
    : store_(store), metrics_(metrics) {}

BacktestResult ValidationEngine::run_backtest(std::span<const Period> train_periods,
                                              Period test_period,
                                              const ParameterSet& params,
                                              std::span<const PlayerId> players) const {
    for (const Period t : train_periods) {
        if (t >= test_period) {
            throw LookaheadViolation({}, test_period, t);
        }
    }
    const formula::FormulaEngine engine(params);
    const std::set<Period> train(train_periods.begin(), train_periods.end());

    std::vector<PlayerId> roster(players.begin(), players.end());
    if (roster.empty()) {
        roster = store_.players_at(test_period);
    }
    std::sort(roster.begin(), roster.end());

    BacktestResult result;
    result.test_period = test_period;

    for (const auto& player : roster) {
        const PlayerHistory full = store_.player_history(player, test_period);

        PlayerHistory history{.player_id = player, .snapshots = {}};
        const RawSnapshot* test_snapshot   = nullptr;
        const RawSnapshot* latest_training = nullptr;
        for (const auto& s : full.snapshots) {
            if (s.period > test_period) {
                throw LookaheadViolation(player, test_period, s.period);
            }
            if (s.period == test_period) {
                test_snapshot = &s;
            } else if (train.count(s.period) != 0) {
                history.snapshots.push_back(s);
                if (!latest_training || s.period > latest_training->period) latest_training = &s;
            }
        }
        if (test_snapshot) {
            // Points, minutes and shot rate of the tested period are observed
            // with its outcome; the latter two fall back to the last training period.
            RawSnapshot context = *test_snapshot;
            context.points.reset();
            context.shot_rate = latest_training ? latest_training->shot_rate : std::nullopt;
            context.minutes   = latest_training ? latest_training->minutes : 0.0;
            history.snapshots.push_back(std::move(context));
        }
        if (history.empty()) {
            ++result.skipped;
            continue;
        }

        Prediction prediction = engine.evaluate(history, test_period);
        ++result.evaluated;

        const std::optional<double> actual = store_.realized_outcome(player, test_period);
        if (!actual) {
            ++result.excluded;
            continue;
        }
        result.pairs.push_back(PredictionOutcome{std::move(prediction), *actual});
    }
    return result;
}

WalkForwardResult ValidationEngine::walk_forward(const ParameterSet& params,
                                                 PeriodRange range,
                                                 std::size_t min_train_periods,
                                                 std::size_t sample_size,
                                                 std::uint64_t seed) const {
    std::vector<Period> periods;
    for (const Period p : store_.periods()) {
        if (range.contains(p)) periods.push_back(p);
    }

    WalkForwardResult out;
    for (std::size_t i = min_train_periods; i < periods.size(); ++i) {
        const Period test = periods[i];
        const std::span<const Period> train(periods.data(), i);

        std::vector<PlayerId> roster = store_.players_at(test);
        if (roster.empty()) continue;
        if (sample_size > 0 && roster.size() > sample_size) {
            std::mt19937_64 rng(seed ^ (static_cast<std::uint64_t>(test) * 0x9E3779B97F4A7C15ULL));
            std::vector<PlayerId> sampled;
            sampled.reserve(sample_size);
            std::sample(roster.begin(), roster.end(), std::back_inserter(sampled), sample_size, rng);
            roster = std::move(sampled);
        }

        BacktestResult bt = run_backtest(train, test, params, roster);
        out.evaluated += bt.evaluated;
        out.excluded  += bt.excluded;
        out.skipped   += bt.skipped;
        out.tested_periods.push_back(test);
        std::move(bt.pairs.begin(), bt.pairs.end(), std::back_inserter(out.pairs));
    }
    return out;
}

ValidationMetrics ValidationEngine::compute_metrics(std::span<const PredictionOutcome> pairs) const {
    return MetricsCalculator::compute(pairs, metrics_);
}

ComparisonReport ValidationEngine::compare(const ParameterSet& a,
                                           const ParameterSet& b,
                                           PeriodRange range,
                                           std::size_t min_train_periods) const {
    validate(a);
    validate(b);
    const WalkForwardResult wa = walk_forward(a, range, min_train_periods);
    const WalkForwardResult wb = walk_forward(b, range, min_train_periods);
    return ComparisonReport{
        .name_a = a.identity(),
        .name_b = b.identity(),
        .a      = compute_metrics(wa.pairs),
        .b      = compute_metrics(wb.pairs),
    };
}

std::vector<PredictionOutcome>
ValidationEngine::top_predictions(std::span<const PredictionOutcome> pairs, std::size_t n) {
    return top_by(pairs, n, true);
}

std::vector<PredictionOutcome>
ValidationEngine::top_actuals(std::span<const PredictionOutcome> pairs, std::size_t n) {
    return top_by(pairs, n, false);
}

} // namespace fvh::validation
