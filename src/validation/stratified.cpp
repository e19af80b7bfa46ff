/// @file src/validation/stratified.cpp
/// @brief Robustness checks: metrics per position, fixture difficulty bucket
///        and price tier.

#include "fvh/validation.hpp"
#include "fvh/constants.hpp"

#include <functional>
#include <map>

namespace fvh::validation {

namespace {

using Labeler = std::function<std::string(const Prediction&)>;

/// Append one Stratum per label, in `order`, for the labels that occur.
void add_dimension(std::vector<Stratum>& out,
                   std::span<const PredictionOutcome> pairs,
                   const std::string& dimension,
                   const std::vector<std::string>& order,
                   const Labeler& label_of,
                   const MetricsConfig& config) {
    std::map<std::string, std::vector<PredictionOutcome>> groups;
    for (const auto& pair : pairs) {
        groups[label_of(pair.prediction)].push_back(pair);
    }
    for (const auto& label : order) {
        const auto it = groups.find(label);
        if (it == groups.end()) continue;
        out.push_back(Stratum{
            .dimension = dimension,
            .label     = label,
            .metrics   = MetricsCalculator::compute(it->second, config),
        });
    }
}

} // anonymous namespace

std::string ValidationEngine::fixture_bucket(const Prediction& p) {
    if (!p.fixture_difficulty) return "unknown";
    if (*p.fixture_difficulty < constants::EASY_FIXTURE_THRESHOLD) return "easy";
    if (*p.fixture_difficulty > constants::HARD_FIXTURE_THRESHOLD) return "hard";
    return "neutral";
}

std::string ValidationEngine::price_tier(const Prediction& p) {
    if (p.has_issue(DataQualityIssue::MissingPrice) ||
        p.has_issue(DataQualityIssue::NonPositivePrice)) {
        return "unknown";
    }
    if (p.price_used < constants::MID_PRICE_THRESHOLD) return "budget";
    if (p.price_used < constants::PREMIUM_PRICE_THRESHOLD) return "mid";
    return "premium";
}

std::vector<Stratum> ValidationEngine::stratify(std::span<const PredictionOutcome> pairs) const {
    std::vector<Stratum> strata;
    add_dimension(strata, pairs, "position", {"G", "D", "M", "F"},
                  [](const Prediction& p) { return std::string(to_string(p.position)); },
                  metrics_);
    add_dimension(strata, pairs, "fixture", {"easy", "neutral", "hard", "unknown"},
                  &ValidationEngine::fixture_bucket, metrics_);
    add_dimension(strata, pairs, "price", {"budget", "mid", "premium", "unknown"},
                  &ValidationEngine::price_tier, metrics_);
    return strata;
}

} // namespace fvh::validation
