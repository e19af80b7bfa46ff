#pragma once

/// @file include/fvh/types.hpp
/// @brief Shared value types for the Fantasy Value Hunter core.
///
/// Raw per-player snapshots as imported from the data sources, the
/// period-ordered history the formula consumes, and the Prediction it
/// produces. Everything here is plain data; behaviour lives in the formula,
/// store and validation modules.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fvh {

using PlayerId = std::string;

/// Gameweek index. Period 1 is the first period of the season.
using Period = int;

// ─── Enumerations ─────────────────────────────────────────────────────────────

enum class Position : std::uint8_t {
    Goalkeeper,
    Defender,
    Midfielder,
    Forward,
};

static constexpr std::size_t POSITION_COUNT = 4;

[[nodiscard]] constexpr std::size_t index_of(Position p) noexcept {
    return static_cast<std::size_t>(p);
}

/// Accepts "G"/"GK"/"GKP", "D"/"DEF", "M"/"MID", "F"/"FWD" (case-insensitive).
[[nodiscard]] std::optional<Position> parse_position(std::string_view text) noexcept;

/// Single-letter code: "G", "D", "M" or "F".
[[nodiscard]] std::string_view to_string(Position p) noexcept;

/// Expected participation for the upcoming period.
enum class StarterStatus : std::uint8_t {
    Confirmed,
    RotationRisk,
    Bench,
    RuledOut,
};

/// Accepts "confirmed", "rotation_risk", "bench", "ruled_out" (case-insensitive).
[[nodiscard]] std::optional<StarterStatus> parse_starter_status(std::string_view text) noexcept;
[[nodiscard]] std::string_view to_string(StarterStatus s) noexcept;

/// A signal the formula wanted but did not get, or got in unusable form.
/// Each one degrades a multiplier to neutral (or a value to its floor).
enum class DataQualityIssue : std::uint8_t {
    EmptyHistory,
    MissingPriorBaseline,
    NoCurrentObservations,
    InsufficientFormHistory,
    MissingFixtureDifficulty,
    MissingShotRate,
    ShotRateBaselineTooSmall,
    MissingStarterStatus,
    MissingPrice,
    NonPositivePrice,
};

[[nodiscard]] std::string_view to_string(DataQualityIssue issue) noexcept;
[[nodiscard]] std::optional<DataQualityIssue> parse_data_quality_issue(std::string_view text) noexcept;

// ─── Snapshots ────────────────────────────────────────────────────────────────

/// One imported record for one player in one period.
///
/// `points` is absent for a period that has not been played yet. A
/// (player, period, revision) triple is written once; corrections arrive as a
/// higher revision.
struct RawSnapshot {
    PlayerId                     player_id;
    Period                       period   = 0;
    Position                     position = Position::Midfielder;
    std::optional<double>        points;
    double                       minutes  = 0.0;
    std::optional<double>        shot_rate;           ///< Shot-creation rate this period
    std::optional<double>        shot_rate_baseline;  ///< Historical shot-creation rate
    std::optional<double>        price;
    std::optional<double>        fixture_difficulty;  ///< Signed, negative = easier
    std::optional<StarterStatus> starter_status;      ///< Imported from the feed
    std::optional<StarterStatus> starter_override;    ///< Manual, wins over the feed
    std::optional<double>        prior_baseline;      ///< Prior-season points per period
    int                          revision = 0;

    bool operator==(const RawSnapshot&) const = default;
};

/// Snapshots of one player, one per period (latest revision), period ascending.
struct PlayerHistory {
    PlayerId                 player_id;
    std::vector<RawSnapshot> snapshots;

    [[nodiscard]] bool empty() const noexcept { return snapshots.empty(); }
};

// ─── Prediction ───────────────────────────────────────────────────────────────

/// Output of one formula evaluation. Never mutated after construction.
struct Prediction {
    PlayerId              player_id;
    Period                period = 0;
    std::string           parameter_set;  ///< ParameterSet::identity()
    Position              position = Position::Midfielder;

    double blended_baseline   = 0.0;
    double blend_weight       = 0.0;
    double form_multiplier    = 1.0;
    double fixture_multiplier = 1.0;
    double starter_multiplier = 1.0;
    double ratio_multiplier   = 1.0;
    double final_value        = 0.0;
    double value_per_price    = 0.0;
    double price_used         = 0.0;
    bool   global_cap_applied = false;

    std::optional<double>         fixture_difficulty;  ///< Input echo, for stratification
    std::vector<DataQualityIssue> data_quality;

    bool operator==(const Prediction&) const = default;

    [[nodiscard]] bool has_issue(DataQualityIssue issue) const noexcept;

    /// One-line human-readable summary.
    [[nodiscard]] std::string to_string() const;
};

} // namespace fvh
