#pragma once

/// @file include/fvh/parameters.hpp
/// @brief Versioned bundle of formula coefficients.
///
/// # Module: ParameterSet
///
/// ## Responsibility
/// Carries every coefficient the FormulaEngine reads: decay rate, lookback,
/// adaptation horizon, clamp bounds and optional tighter caps, the global
/// cap, per-position weighting, penalties, floors, and the strategy tag per
/// multiplier together with the legacy tables those strategies use.
///
/// ## Guarantees
/// - Pure data, passed explicitly; there is no process-wide configuration
/// - validate() rejects every invariant violation with InvalidParameterSet
/// - defaults() reproduces the documented default parameter file
///
/// ## NOT Responsible For
/// - Persistence (see records.hpp)
/// - Evaluation (see formula.hpp)

#include "fvh/constants.hpp"
#include "fvh/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fvh {

// ─── Building Blocks ──────────────────────────────────────────────────────────

/// Closed interval a multiplier is clamped into.
struct MultiplierBounds {
    double min = 0.5;
    double max = 2.0;

    [[nodiscard]] double clamp(double value) const noexcept;
    [[nodiscard]] bool   contains(double value) const noexcept;

    /// Intersection with an optional tighter cap. Without a cap, *this.
    [[nodiscard]] MultiplierBounds intersect(const std::optional<MultiplierBounds>& cap) const noexcept;

    bool operator==(const MultiplierBounds&) const = default;
};

/// How strongly the shot-creation ratio moves a position.
enum class RatioImpact : std::uint8_t {
    Full,      ///< Multiplier is the raw ratio
    Dampened,  ///< 1 + (ratio - 1) x dampening
    Neutral,   ///< Always 1.0
};

struct PositionWeights {
    double      fixture_weight = 1.0;
    RatioImpact ratio_impact   = RatioImpact::Full;

    bool operator==(const PositionWeights&) const = default;
};

struct StarterPenalties {
    double rotation_risk = constants::DEFAULT_ROTATION_PENALTY;
    double bench         = constants::DEFAULT_BENCH_PENALTY;

    bool operator==(const StarterPenalties&) const = default;
};

enum class FormStrategy : std::uint8_t {
    Decayed,      ///< Exponentially decayed average over the lookback window
    FixedWeight,  ///< Legacy weights table over the most recent games
};

enum class FixtureStrategy : std::uint8_t {
    Exponential,  ///< base^(-difficulty x position_weight / 10)
    Tiered,       ///< Legacy step table
};

/// One row of the legacy tiered fixture table: applies to every difficulty
/// up to and including `threshold` not claimed by an earlier row.
struct FixtureTier {
    double threshold  = 0.0;
    double multiplier = 1.0;

    bool operator==(const FixtureTier&) const = default;
};

[[nodiscard]] std::string_view to_string(RatioImpact v) noexcept;
[[nodiscard]] std::string_view to_string(FormStrategy v) noexcept;
[[nodiscard]] std::string_view to_string(FixtureStrategy v) noexcept;
[[nodiscard]] std::optional<RatioImpact>     parse_ratio_impact(std::string_view text) noexcept;
[[nodiscard]] std::optional<FormStrategy>    parse_form_strategy(std::string_view text) noexcept;
[[nodiscard]] std::optional<FixtureStrategy> parse_fixture_strategy(std::string_view text) noexcept;

// ─── ParameterSet ─────────────────────────────────────────────────────────────

/// Usage
/// -----
/// ```cpp
/// ParameterSet p = ParameterSet::defaults();
/// p.decay_rate = 0.9;
/// p.form_cap   = MultiplierBounds{0.6, 1.8};
/// validate(p);                        // throws InvalidParameterSet
/// FormulaEngine engine(p);
/// ```
struct ParameterSet {
    std::string name    = "default";
    int         version = 1;

    double      decay_rate         = constants::DEFAULT_DECAY_RATE;          ///< alpha, (0,1)
    std::size_t lookback           = constants::DEFAULT_LOOKBACK;            ///< L >= 1
    int         adaptation_horizon = constants::DEFAULT_ADAPTATION_HORIZON;  ///< K >= 2

    MultiplierBounds form_bounds{0.5, 2.0};
    MultiplierBounds fixture_bounds{0.5, 1.8};
    MultiplierBounds ratio_bounds{0.5, 2.5};
    std::optional<MultiplierBounds> form_cap;
    std::optional<MultiplierBounds> fixture_cap;
    std::optional<MultiplierBounds> ratio_cap;
    double global_cap = constants::DEFAULT_GLOBAL_CAP;

    double fixture_base       = constants::DEFAULT_FIXTURE_BASE;
    double ratio_dampening    = constants::DEFAULT_RATIO_DAMPENING;
    double ratio_min_baseline = constants::DEFAULT_RATIO_MIN_BASELINE;
    StarterPenalties starter;

    /// Indexed by index_of(Position).
    std::array<PositionWeights, POSITION_COUNT> positions{{
        {1.10, RatioImpact::Neutral},   // Goalkeeper
        {1.20, RatioImpact::Dampened},  // Defender
        {1.00, RatioImpact::Full},      // Midfielder
        {1.05, RatioImpact::Full},      // Forward
    }};

    double baseline_floor         = constants::DEFAULT_BASELINE_FLOOR;
    double price_floor            = constants::DEFAULT_PRICE_FLOOR;
    double default_prior_baseline = constants::DEFAULT_PRIOR_BASELINE;

    FormStrategy        form_strategy = FormStrategy::Decayed;
    std::vector<double> form_fixed_weights{0.5, 0.3, 0.2};  ///< Most recent first

    FixtureStrategy          fixture_strategy = FixtureStrategy::Exponential;
    std::vector<FixtureTier> fixture_tiers{
        {-6.0, 1.30}, {-2.0, 1.15}, {2.0, 1.00}, {6.0, 0.85}, {10.0, 0.70},
    };

    bool operator==(const ParameterSet&) const = default;

    [[nodiscard]] static ParameterSet defaults();

    /// "name@vN"; stamped on every Prediction.
    [[nodiscard]] std::string identity() const;

    [[nodiscard]] const PositionWeights& weights_for(Position p) const noexcept {
        return positions[index_of(p)];
    }

    /// Step bounds intersected with the optional tighter cap.
    [[nodiscard]] MultiplierBounds effective_form_bounds() const noexcept;
    [[nodiscard]] MultiplierBounds effective_fixture_bounds() const noexcept;
    [[nodiscard]] MultiplierBounds effective_ratio_bounds() const noexcept;
};

/// First violated invariant, described; nullopt when the set is valid.
[[nodiscard]] std::optional<std::string> find_violation(const ParameterSet& params);

/// Throws InvalidParameterSet naming the set and the first violation.
void validate(const ParameterSet& params);

} // namespace fvh
