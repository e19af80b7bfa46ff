/// @file src/formula/parameter_set.cpp
/// @brief ParameterSet defaults, bounds arithmetic and invariant checks.

#include "fvh/parameters.hpp"
#include "fvh/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numeric>
#include <string>

namespace fvh {

namespace {

bool finite_all(std::initializer_list<double> values) noexcept {
    return std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

std::optional<std::string> check_bounds(std::string_view label, const MultiplierBounds& b) {
    if (!finite_all({b.min, b.max})) {
        return fmt::format("{} bounds must be finite", label);
    }
    if (b.min < 0.0 || b.min > 1.0 || b.max < 1.0) {
        return fmt::format("{} bounds [{}, {}] must satisfy 0 <= min <= 1 <= max",
                           label, b.min, b.max);
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── MultiplierBounds ─────────────────────────────────────────────────────────

double MultiplierBounds::clamp(double value) const noexcept {
    return std::clamp(value, min, max);
}

bool MultiplierBounds::contains(double value) const noexcept {
    return value >= min && value <= max;
}

MultiplierBounds MultiplierBounds::intersect(const std::optional<MultiplierBounds>& cap) const noexcept {
    if (!cap) return *this;
    return MultiplierBounds{std::max(min, cap->min), std::min(max, cap->max)};
}

// ─── Enum text ────────────────────────────────────────────────────────────────

std::string_view to_string(RatioImpact v) noexcept {
    switch (v) {
        case RatioImpact::Full:     return "full";
        case RatioImpact::Dampened: return "dampened";
        case RatioImpact::Neutral:  return "neutral";
    }
    return "?";
}

std::string_view to_string(FormStrategy v) noexcept {
    switch (v) {
        case FormStrategy::Decayed:     return "decayed";
        case FormStrategy::FixedWeight: return "fixed_weight";
    }
    return "?";
}

std::string_view to_string(FixtureStrategy v) noexcept {
    switch (v) {
        case FixtureStrategy::Exponential: return "exponential";
        case FixtureStrategy::Tiered:      return "tiered";
    }
    return "?";
}

std::optional<RatioImpact> parse_ratio_impact(std::string_view text) noexcept {
    for (const auto v : {RatioImpact::Full, RatioImpact::Dampened, RatioImpact::Neutral}) {
        if (to_string(v) == text) return v;
    }
    return std::nullopt;
}

std::optional<FormStrategy> parse_form_strategy(std::string_view text) noexcept {
    for (const auto v : {FormStrategy::Decayed, FormStrategy::FixedWeight}) {
        if (to_string(v) == text) return v;
    }
    return std::nullopt;
}

std::optional<FixtureStrategy> parse_fixture_strategy(std::string_view text) noexcept {
    for (const auto v : {FixtureStrategy::Exponential, FixtureStrategy::Tiered}) {
        if (to_string(v) == text) return v;
    }
    return std::nullopt;
}

// ─── ParameterSet ─────────────────────────────────────────────────────────────

ParameterSet ParameterSet::defaults() {
    return ParameterSet{};
}

std::string ParameterSet::identity() const {
    return fmt::format("{}@v{}", name, version);
}

MultiplierBounds ParameterSet::effective_form_bounds() const noexcept {
    return form_bounds.intersect(form_cap);
}

MultiplierBounds ParameterSet::effective_fixture_bounds() const noexcept {
    return fixture_bounds.intersect(fixture_cap);
}

MultiplierBounds ParameterSet::effective_ratio_bounds() const noexcept {
    return ratio_bounds.intersect(ratio_cap);
}

// ─── Validation ───────────────────────────────────────────────────────────────

std::optional<std::string> find_violation(const ParameterSet& p) {
    if (p.name.empty()) {
        return std::string{"name must not be empty"};
    }
    if (!std::isfinite(p.decay_rate) || p.decay_rate <= 0.0 || p.decay_rate >= 1.0) {
        return fmt::format("decay rate {} must lie strictly inside (0, 1)", p.decay_rate);
    }
    if (p.lookback < 1) {
        return std::string{"lookback must be at least 1"};
    }
    if (p.adaptation_horizon < 2) {
        return fmt::format("adaptation horizon {} must be at least 2", p.adaptation_horizon);
    }

    if (auto v = check_bounds("form", p.form_bounds))       return v;
    if (auto v = check_bounds("fixture", p.fixture_bounds)) return v;
    if (auto v = check_bounds("ratio", p.ratio_bounds))     return v;
    if (p.form_cap)    { if (auto v = check_bounds("form cap", *p.form_cap))       return v; }
    if (p.fixture_cap) { if (auto v = check_bounds("fixture cap", *p.fixture_cap)) return v; }
    if (p.ratio_cap)   { if (auto v = check_bounds("ratio cap", *p.ratio_cap))     return v; }

    if (!std::isfinite(p.global_cap) || p.global_cap < 1.0) {
        return fmt::format("global cap {} must be at least 1", p.global_cap);
    }
    if (!std::isfinite(p.fixture_base) || p.fixture_base <= 0.0) {
        return fmt::format("fixture base {} must be positive", p.fixture_base);
    }
    if (!std::isfinite(p.ratio_dampening) || p.ratio_dampening < 0.0 || p.ratio_dampening > 1.0) {
        return fmt::format("ratio dampening {} must lie in [0, 1]", p.ratio_dampening);
    }
    if (!std::isfinite(p.ratio_min_baseline) || p.ratio_min_baseline < 0.0) {
        return fmt::format("ratio minimum baseline {} must be non-negative", p.ratio_min_baseline);
    }

    const auto& s = p.starter;
    if (!finite_all({s.rotation_risk, s.bench}) ||
        s.rotation_risk < 0.0 || s.rotation_risk > 1.0 || s.bench < 0.0 || s.bench > 1.0) {
        return std::string{"starter penalties must lie in [0, 1]"};
    }
    if (s.bench > s.rotation_risk) {
        return fmt::format("bench penalty {} must not exceed rotation penalty {}",
                           s.bench, s.rotation_risk);
    }

    for (const auto& w : p.positions) {
        if (!std::isfinite(w.fixture_weight) || w.fixture_weight < 0.0) {
            return fmt::format("position fixture weight {} must be non-negative", w.fixture_weight);
        }
    }

    if (!finite_all({p.baseline_floor, p.price_floor, p.default_prior_baseline}) ||
        p.baseline_floor <= 0.0 || p.price_floor <= 0.0) {
        return std::string{"baseline and price floors must be positive"};
    }
    if (p.default_prior_baseline < 0.0) {
        return std::string{"default prior baseline must be non-negative"};
    }

    const auto& fw = p.form_fixed_weights;
    if (fw.empty()) {
        return std::string{"fixed form weights must not be empty"};
    }
    if (std::any_of(fw.begin(), fw.end(), [](double w) { return !std::isfinite(w) || w < 0.0; })) {
        return std::string{"fixed form weights must be finite and non-negative"};
    }
    if (std::accumulate(fw.begin(), fw.end(), 0.0) <= 0.0) {
        return std::string{"fixed form weights must have a positive sum"};
    }

    const auto& tiers = p.fixture_tiers;
    if (tiers.empty()) {
        return std::string{"fixture tier table must not be empty"};
    }
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        if (!finite_all({tiers[i].threshold, tiers[i].multiplier}) || tiers[i].multiplier <= 0.0) {
            return fmt::format("fixture tier {} must be finite with a positive multiplier", i);
        }
        if (i > 0 && tiers[i].threshold <= tiers[i - 1].threshold) {
            return std::string{"fixture tier thresholds must be strictly ascending"};
        }
    }

    return std::nullopt;
}

void validate(const ParameterSet& params) {
    if (auto violation = find_violation(params)) {
        throw InvalidParameterSet(
            fmt::format("invalid parameter set '{}': {}", params.identity(), *violation));
    }
}

} // namespace fvh
