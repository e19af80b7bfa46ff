/// @file src/core/types.cpp
/// @brief Enum text conversions and Prediction formatting.

#include "fvh/types.hpp"
#include "fvh/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace fvh {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

constexpr std::array<std::pair<DataQualityIssue, std::string_view>, 10> kIssueNames{{
    {DataQualityIssue::EmptyHistory,             "empty_history"},
    {DataQualityIssue::MissingPriorBaseline,     "missing_prior_baseline"},
    {DataQualityIssue::NoCurrentObservations,    "no_current_observations"},
    {DataQualityIssue::InsufficientFormHistory,  "insufficient_form_history"},
    {DataQualityIssue::MissingFixtureDifficulty, "missing_fixture_difficulty"},
    {DataQualityIssue::MissingShotRate,          "missing_shot_rate"},
    {DataQualityIssue::ShotRateBaselineTooSmall, "shot_rate_baseline_too_small"},
    {DataQualityIssue::MissingStarterStatus,     "missing_starter_status"},
    {DataQualityIssue::MissingPrice,             "missing_price"},
    {DataQualityIssue::NonPositivePrice,         "non_positive_price"},
}};

} // anonymous namespace

// ─── Position ─────────────────────────────────────────────────────────────────

std::optional<Position> parse_position(std::string_view text) noexcept {
    const auto is = [text](std::string_view code) { return iequals(text, code); };
    if (is("g") || is("gk") || is("gkp")) return Position::Goalkeeper;
    if (is("d") || is("def"))             return Position::Defender;
    if (is("m") || is("mid"))             return Position::Midfielder;
    if (is("f") || is("fwd"))             return Position::Forward;
    return std::nullopt;
}

std::string_view to_string(Position p) noexcept {
    switch (p) {
        case Position::Goalkeeper: return "G";
        case Position::Defender:   return "D";
        case Position::Midfielder: return "M";
        case Position::Forward:    return "F";
    }
    return "?";
}

// ─── StarterStatus ────────────────────────────────────────────────────────────

std::optional<StarterStatus> parse_starter_status(std::string_view text) noexcept {
    for (const auto s : {StarterStatus::Confirmed, StarterStatus::RotationRisk,
                         StarterStatus::Bench, StarterStatus::RuledOut}) {
        if (iequals(text, to_string(s))) return s;
    }
    return std::nullopt;
}

std::string_view to_string(StarterStatus s) noexcept {
    switch (s) {
        case StarterStatus::Confirmed:    return "confirmed";
        case StarterStatus::RotationRisk: return "rotation_risk";
        case StarterStatus::Bench:        return "bench";
        case StarterStatus::RuledOut:     return "ruled_out";
    }
    return "?";
}

// ─── DataQualityIssue ─────────────────────────────────────────────────────────

std::string_view to_string(DataQualityIssue issue) noexcept {
    for (const auto& [value, name] : kIssueNames) {
        if (value == issue) return name;
    }
    return "?";
}

std::optional<DataQualityIssue> parse_data_quality_issue(std::string_view text) noexcept {
    for (const auto& [value, name] : kIssueNames) {
        if (name == text) return value;
    }
    return std::nullopt;
}

// ─── Prediction ───────────────────────────────────────────────────────────────

bool Prediction::has_issue(DataQualityIssue issue) const noexcept {
    return std::find(data_quality.begin(), data_quality.end(), issue) != data_quality.end();
}

std::string Prediction::to_string() const {
    std::string issues;
    for (const auto issue : data_quality) {
        if (!issues.empty()) issues += ',';
        issues += fvh::to_string(issue);
    }
    return fmt::format(
        "{} P{} [{}] {} baseline={:.3f} (w={:.3f}) form={:.3f} fixture={:.3f} "
        "starter={:.3f} ratio={:.3f} -> value={:.3f}{} vpp={:.3f}{}{}",
        player_id, period, fvh::to_string(position), parameter_set,
        blended_baseline, blend_weight, form_multiplier, fixture_multiplier,
        starter_multiplier, ratio_multiplier, final_value,
        global_cap_applied ? " (capped)" : "", value_per_price,
        issues.empty() ? "" : " dq=", issues);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

LookaheadViolation::LookaheadViolation(const PlayerId& player, Period as_of, Period offending)
    : Error(fmt::format("look-ahead: {}period {} reached an evaluation as of period {}",
                        player.empty() ? std::string{} : fmt::format("player '{}' ", player),
                        offending, as_of)),
      as_of_(as_of),
      offending_(offending) {}

} // namespace fvh
