/// @file src/formula/multipliers.cpp
/// @brief Baseline blending and the per-multiplier policy functions.
///
/// Every policy returns a value inside its effective bounds. When its input
/// is missing it returns exactly NEUTRAL_MULTIPLIER and names the reason.

#include "fvh/formula.hpp"
#include "fvh/constants.hpp"

#include <algorithm>
#include <cmath>

namespace fvh::formula {

using constants::NEUTRAL_MULTIPLIER;
using constants::MIN_FORM_OBSERVATIONS;

// ─── Baseline Blending ────────────────────────────────────────────────────────

double blend_weight(Period period, int horizon) noexcept {
    if (period <= 1) return 0.0;
    if (horizon < 2) return 1.0;
    const double w = static_cast<double>(period - 1) / static_cast<double>(horizon - 1);
    return std::min(1.0, w);
}

BlendResult blend_baseline(double prior,
                           std::optional<double> current_average,
                           Period period,
                           const ParameterSet& params) noexcept {
    if (!current_average) {
        return BlendResult{.baseline = std::max(prior, params.baseline_floor), .weight = 0.0};
    }
    const double w       = blend_weight(period, params.adaptation_horizon);
    const double blended = w * *current_average + (1.0 - w) * prior;
    return BlendResult{.baseline = std::max(blended, params.baseline_floor), .weight = w};
}

// ─── Weighted Scores ──────────────────────────────────────────────────────────

std::optional<double> decayed_score(std::span<const double> recent_first, double alpha) noexcept {
    if (recent_first.size() < MIN_FORM_OBSERVATIONS) {
        return std::nullopt;
    }
    double weight      = 1.0;
    double weight_sum  = 0.0;
    double weighted    = 0.0;
    for (const double points : recent_first) {
        weighted   += weight * points;
        weight_sum += weight;
        weight     *= alpha;
    }
    return weighted / weight_sum;
}

std::optional<double> fixed_weight_score(std::span<const double> recent_first,
                                         std::span<const double> weights) noexcept {
    if (recent_first.size() < MIN_FORM_OBSERVATIONS) {
        return std::nullopt;
    }
    const std::size_t n = std::min(recent_first.size(), weights.size());
    double weight_sum = 0.0;
    double weighted   = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        weighted   += weights[i] * recent_first[i];
        weight_sum += weights[i];
    }
    if (weight_sum <= 0.0) {
        return std::nullopt;
    }
    return weighted / weight_sum;
}

// ─── Form ─────────────────────────────────────────────────────────────────────

MultiplierResult form_multiplier(std::span<const double> recent_first,
                                 double blended_baseline,
                                 const ParameterSet& params) noexcept {
    const auto window = recent_first.first(std::min(recent_first.size(), params.lookback));

    const std::optional<double> score =
        params.form_strategy == FormStrategy::Decayed
            ? decayed_score(window, params.decay_rate)
            : fixed_weight_score(window, params.form_fixed_weights);

    if (!score || blended_baseline <= 0.0) {
        return MultiplierResult{NEUTRAL_MULTIPLIER, DataQualityIssue::InsufficientFormHistory};
    }
    return MultiplierResult{params.effective_form_bounds().clamp(*score / blended_baseline), {}};
}

// ─── Fixture ──────────────────────────────────────────────────────────────────

MultiplierResult fixture_multiplier(std::optional<double> difficulty,
                                    Position position,
                                    const ParameterSet& params) noexcept {
    if (!difficulty || !std::isfinite(*difficulty)) {
        return MultiplierResult{NEUTRAL_MULTIPLIER, DataQualityIssue::MissingFixtureDifficulty};
    }

    double raw = NEUTRAL_MULTIPLIER;
    if (params.fixture_strategy == FixtureStrategy::Exponential) {
        const double exponent = -*difficulty * params.weights_for(position).fixture_weight / 10.0;
        raw = std::pow(params.fixture_base, exponent);
    } else {
        const auto& tiers = params.fixture_tiers;
        const auto  tier  = std::find_if(tiers.begin(), tiers.end(),
                                         [d = *difficulty](const FixtureTier& t) { return d <= t.threshold; });
        if (tier != tiers.end()) {
            raw = tier->multiplier;
        } else if (!tiers.empty()) {
            raw = tiers.back().multiplier;
        }
    }
    return MultiplierResult{params.effective_fixture_bounds().clamp(raw), {}};
}

// ─── Ratio ────────────────────────────────────────────────────────────────────

MultiplierResult ratio_multiplier(std::optional<double> current_rate,
                                  std::optional<double> baseline_rate,
                                  Position position,
                                  const ParameterSet& params) noexcept {
    const RatioImpact impact = params.weights_for(position).ratio_impact;
    if (impact == RatioImpact::Neutral) {
        return MultiplierResult{NEUTRAL_MULTIPLIER, {}};
    }
    if (!current_rate || !baseline_rate ||
        !std::isfinite(*current_rate) || !std::isfinite(*baseline_rate)) {
        return MultiplierResult{NEUTRAL_MULTIPLIER, DataQualityIssue::MissingShotRate};
    }
    if (*baseline_rate < params.ratio_min_baseline || *baseline_rate <= 0.0) {
        return MultiplierResult{NEUTRAL_MULTIPLIER, DataQualityIssue::ShotRateBaselineTooSmall};
    }

    const double ratio = *current_rate / *baseline_rate;
    const double raw   = impact == RatioImpact::Full
                             ? ratio
                             : 1.0 + (ratio - 1.0) * params.ratio_dampening;
    return MultiplierResult{params.effective_ratio_bounds().clamp(raw), {}};
}

// ─── Starter ──────────────────────────────────────────────────────────────────

MultiplierResult starter_multiplier(std::optional<StarterStatus> imported,
                                    std::optional<StarterStatus> manual,
                                    const ParameterSet& params) noexcept {
    const std::optional<StarterStatus> status = manual ? manual : imported;
    if (!status) {
        return MultiplierResult{params.starter.rotation_risk, DataQualityIssue::MissingStarterStatus};
    }
    switch (*status) {
        case StarterStatus::Confirmed:    return MultiplierResult{1.0, {}};
        case StarterStatus::RotationRisk: return MultiplierResult{params.starter.rotation_risk, {}};
        case StarterStatus::Bench:        return MultiplierResult{params.starter.bench, {}};
        case StarterStatus::RuledOut:     return MultiplierResult{0.0, {}};
    }
    return MultiplierResult{params.starter.rotation_risk, DataQualityIssue::MissingStarterStatus};
}

} // namespace fvh::formula
