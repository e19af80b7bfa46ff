/// @file src/formula/formula_engine.cpp
/// @brief FormulaEngine: composes blending, the four multipliers, the
///        global cap and price normalisation into one Prediction.

#include "fvh/formula.hpp"
#include "fvh/constants.hpp"
#include "fvh/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace fvh::formula {

namespace {

/// One snapshot per period: the highest revision replaces earlier ones.
/// Result is ordered by period.
std::vector<RawSnapshot> latest_revisions(const std::vector<RawSnapshot>& snapshots) {
    std::vector<RawSnapshot> latest(snapshots);
    std::stable_sort(latest.begin(), latest.end(), [](const auto& a, const auto& b) {
        return a.period != b.period ? a.period < b.period : a.revision > b.revision;
    });
    latest.erase(std::unique(latest.begin(), latest.end(),
                             [](const auto& a, const auto& b) { return a.period == b.period; }),
                 latest.end());
    return latest;
}

/// Realized points, most recent period first.
std::vector<double> observations_recent_first(const std::vector<RawSnapshot>& snapshots) {
    std::vector<std::pair<Period, double>> observed;
    observed.reserve(snapshots.size());
    for (const auto& s : snapshots) {
        if (s.points && std::isfinite(*s.points)) {
            observed.emplace_back(s.period, *s.points);
        }
    }
    std::stable_sort(observed.begin(), observed.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<double> points;
    points.reserve(observed.size());
    for (const auto& [period, value] : observed) {
        points.push_back(value);
    }
    return points;
}

/// Prior baseline from the latest snapshot that carries one.
std::optional<double> latest_prior(const std::vector<RawSnapshot>& snapshots) noexcept {
    std::optional<double> prior;
    Period prior_period = 0;
    for (const auto& s : snapshots) {
        if (s.prior_baseline && std::isfinite(*s.prior_baseline) &&
            (!prior || s.period >= prior_period)) {
            prior        = s.prior_baseline;
            prior_period = s.period;
        }
    }
    return prior;
}

void record(Prediction& p, const MultiplierResult& r) {
    if (r.issue) p.data_quality.push_back(*r.issue);
}

} // anonymous namespace

// ─── FormulaEngine ────────────────────────────────────────────────────────────

FormulaEngine::FormulaEngine(ParameterSet params)
    : params_(std::move(params)) {
    validate(params_);
}

Prediction FormulaEngine::evaluate(const PlayerHistory& history, Period as_of) const {
    for (const auto& s : history.snapshots) {
        if (s.period > as_of) {
            throw LookaheadViolation(history.player_id, as_of, s.period);
        }
    }

    Prediction p;
    p.player_id     = history.player_id;
    p.period        = as_of;
    p.parameter_set = params_.identity();

    if (history.empty()) {
        // Nothing known: prior default, neutral multipliers, rotation penalty.
        p.data_quality.push_back(DataQualityIssue::EmptyHistory);
        p.blended_baseline = std::max(params_.default_prior_baseline, params_.baseline_floor);
        record(p, fixture_multiplier(std::nullopt, p.position, params_));
        const auto starter = starter_multiplier(std::nullopt, std::nullopt, params_);
        p.starter_multiplier = starter.value;
        record(p, starter);
        p.final_value = p.blended_baseline * p.starter_multiplier;
        p.price_used  = params_.price_floor;
        p.data_quality.push_back(DataQualityIssue::MissingPrice);
        p.value_per_price = p.final_value / p.price_used;
        return p;
    }

    const std::vector<RawSnapshot> snapshots = latest_revisions(history.snapshots);
    const RawSnapshot& context = snapshots.back();
    p.position           = context.position;
    p.fixture_difficulty = context.fixture_difficulty;

    // 1. Baseline blending.
    const std::optional<double> prior = latest_prior(snapshots);
    if (!prior) {
        p.data_quality.push_back(DataQualityIssue::MissingPriorBaseline);
    }
    const std::vector<double> recent = observations_recent_first(snapshots);
    std::optional<double> current_average;
    if (!recent.empty()) {
        current_average = std::accumulate(recent.begin(), recent.end(), 0.0) /
                          static_cast<double>(recent.size());
    } else {
        p.data_quality.push_back(DataQualityIssue::NoCurrentObservations);
    }
    const BlendResult blend =
        blend_baseline(prior.value_or(params_.default_prior_baseline), current_average, as_of, params_);
    p.blended_baseline = blend.baseline;
    p.blend_weight     = blend.weight;

    // 2-5. Multipliers.
    const auto form    = form_multiplier(recent, p.blended_baseline, params_);
    const auto fixture = fixture_multiplier(context.fixture_difficulty, p.position, params_);
    const auto ratio   = ratio_multiplier(context.shot_rate, context.shot_rate_baseline,
                                          p.position, params_);
    const auto starter = starter_multiplier(context.starter_status, context.starter_override, params_);
    p.form_multiplier    = form.value;
    p.fixture_multiplier = fixture.value;
    p.ratio_multiplier   = ratio.value;
    p.starter_multiplier = starter.value;
    record(p, form);
    record(p, fixture);
    record(p, ratio);
    record(p, starter);

    // 6. Combination and global cap.
    const double product = p.blended_baseline * p.form_multiplier * p.fixture_multiplier *
                           p.starter_multiplier * p.ratio_multiplier;
    const double ceiling = p.blended_baseline * params_.global_cap;
    p.global_cap_applied = product > ceiling;
    p.final_value        = p.global_cap_applied ? ceiling : product;

    // 7. Value per price.
    if (!context.price || !std::isfinite(*context.price)) {
        p.data_quality.push_back(DataQualityIssue::MissingPrice);
        p.price_used = params_.price_floor;
    } else if (*context.price <= 0.0) {
        p.data_quality.push_back(DataQualityIssue::NonPositivePrice);
        p.price_used = params_.price_floor;
    } else {
        p.price_used = std::max(*context.price, params_.price_floor);
    }
    p.value_per_price = p.final_value / p.price_used;

    return p;
}

// ─── Free function ────────────────────────────────────────────────────────────

Prediction evaluate(const PlayerHistory& history, const ParameterSet& params, Period as_of) {
    return FormulaEngine(params).evaluate(history, as_of);
}

} // namespace fvh::formula
