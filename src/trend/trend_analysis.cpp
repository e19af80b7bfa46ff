/// @file src/trend/trend_analysis.cpp
/// @brief TrendAnalysisEngine: formula recomputation over period ranges.

#include "fvh/trend.hpp"
#include "fvh/formula.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <future>
#include <map>
#include <utility>

namespace fvh::trend {

namespace {

/// Predictions and failure count for one slice of players at one period.
struct SliceResult {
    std::vector<Prediction> predictions;
    std::size_t             failed = 0;
};

SliceResult evaluate_slice(const store::RawSnapshotStore& store,
                           const formula::FormulaEngine& engine,
                           std::span<const PlayerId> players,
                           Period period) {
    SliceResult out;
    out.predictions.reserve(players.size());
    for (const auto& player : players) {
        const PlayerHistory history = store.player_history(player, period);
        if (history.empty()) {
            ++out.failed;
            continue;
        }
        out.predictions.push_back(engine.evaluate(history, period));
    }
    return out;
}

} // anonymous namespace

// ─── TrendRun ─────────────────────────────────────────────────────────────────

std::string TrendRun::to_string() const {
    std::map<std::string_view, std::size_t> by_kind;
    for (const auto& p : predictions) {
        for (const auto issue : p.data_quality) ++by_kind[fvh::to_string(issue)];
    }
    std::string out = fmt::format("{} periods {}-{}: {} predictions, {} failed, {} degraded",
                                  parameter_set, first, last, succeeded, failed, degraded);
    for (const auto& [kind, count] : by_kind) {
        out += fmt::format("\n  {:<30} {}", kind, count);
    }
    return out;
}

// ─── TrendAnalysisEngine ──────────────────────────────────────────────────────

TrendAnalysisEngine::TrendAnalysisEngine(const store::RawSnapshotStore& store, TrendConfig config)
    : store_(store), config_(config) {}

TrendRun TrendAnalysisEngine::calculate(const ParameterSet& params,
                                        Period first,
                                        Period last,
                                        std::span<const PlayerId> players) const {
    const formula::FormulaEngine engine(params);

    TrendRun run;
    run.parameter_set = params.identity();
    run.first         = first;
    run.last          = last;

    std::vector<PlayerId> requested(players.begin(), players.end());
    std::sort(requested.begin(), requested.end());

    for (Period period = first; period <= last; ++period) {
        const std::vector<PlayerId> roster = requested.empty() ? store_.players_at(period) : requested;
        if (roster.empty()) continue;

        const std::size_t workers = std::clamp<std::size_t>(config_.workers, 1, roster.size());
        std::vector<SliceResult> slices;

        if (workers == 1) {
            slices.push_back(evaluate_slice(store_, engine, roster, period));
        } else {
            // Contiguous slices keep the merged output in roster order.
            const std::size_t chunk = (roster.size() + workers - 1) / workers;
            std::vector<std::future<SliceResult>> futures;
            for (std::size_t begin = 0; begin < roster.size(); begin += chunk) {
                const std::span<const PlayerId> slice(roster.data() + begin,
                                                      std::min(chunk, roster.size() - begin));
                futures.push_back(std::async(std::launch::async, [this, &engine, slice, period] {
                    return evaluate_slice(store_, engine, slice, period);
                }));
            }
            for (auto& f : futures) slices.push_back(f.get());
        }

        for (auto& slice : slices) {
            run.failed += slice.failed;
            for (auto& p : slice.predictions) {
                if (!p.data_quality.empty()) ++run.degraded;
                run.predictions.push_back(std::move(p));
            }
        }
    }

    run.succeeded = run.predictions.size();
    return run;
}

std::vector<TrendRun>
TrendAnalysisEngine::compare_parameter_sets(std::span<const ParameterSet> sets,
                                            Period first,
                                            Period last,
                                            std::span<const PlayerId> players) const {
    // Validate every set before any evaluation starts.
    for (const auto& params : sets) validate(params);

    std::vector<TrendRun> runs;
    runs.reserve(sets.size());
    for (const auto& params : sets) {
        runs.push_back(calculate(params, first, last, players));
    }
    return runs;
}

std::vector<Prediction> TrendAnalysisEngine::player_trend(const PlayerId& player,
                                                          const ParameterSet& params,
                                                          Period first,
                                                          Period last) const {
    const formula::FormulaEngine engine(params);
    std::vector<Prediction> series;
    for (Period period = first; period <= last; ++period) {
        const PlayerHistory history = store_.player_history(player, period);
        if (history.empty()) continue;
        Prediction p = engine.evaluate(history, period);
        const bool played_in_period =
            std::any_of(history.snapshots.begin(), history.snapshots.end(),
                        [period](const RawSnapshot& s) { return s.period == period; });
        if (played_in_period) series.push_back(std::move(p));
    }
    return series;
}

} // namespace fvh::trend
