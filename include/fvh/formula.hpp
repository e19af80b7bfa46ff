#pragma once

/// @file include/fvh/formula.hpp
/// @brief The parameterized true-value formula.
///
/// # Module: Formula
///
/// ## Responsibility
/// Turn one player's history up to an evaluation period into a Prediction:
///   blended baseline x form x fixture x starter x ratio, capped at
///   blended x global cap, then divided by price.
///
/// Each multiplier has its own policy function so the neutral-fallback
/// contract (missing input -> 1.0 plus a data-quality event) can be tested
/// in isolation. FormulaEngine composes them.
///
/// ## Guarantees
/// - Pure and deterministic: identical inputs give bit-identical output
/// - Never throws for missing or partial data
/// - Form, fixture and ratio always lie inside their effective bounds
/// - final_value <= blended_baseline x global_cap
/// - Throws LookaheadViolation for any snapshot after the evaluation period
///
/// ## NOT Responsible For
/// - Fetching history (see snapshot_store.hpp)
/// - Comparing against realized outcomes (see validation.hpp)

#include "fvh/parameters.hpp"
#include "fvh/types.hpp"

#include <optional>
#include <span>

namespace fvh::formula {

// ─── Policy Results ───────────────────────────────────────────────────────────

/// A multiplier value and, when it fell back to neutral, the reason.
struct MultiplierResult {
    double                          value = 1.0;
    std::optional<DataQualityIssue> issue;
};

struct BlendResult {
    double baseline = 0.0;  ///< Floored
    double weight   = 0.0;  ///< Weight on the current-season average
};

// ─── Baseline Blending ────────────────────────────────────────────────────────

/// w = 0 for period <= 1, else min(1, (period - 1) / (horizon - 1)).
[[nodiscard]] double blend_weight(Period period, int horizon) noexcept;

/// w x current + (1 - w) x prior, floored. Without a current average the
/// prior is used unchanged (still floored).
[[nodiscard]] BlendResult blend_baseline(double prior,
                                         std::optional<double> current_average,
                                         Period period,
                                         const ParameterSet& params) noexcept;

// ─── Weighted Scores ──────────────────────────────────────────────────────────

/// Exponentially decayed average of `recent_first` with weights alpha^i,
/// normalized. nullopt when fewer than MIN_FORM_OBSERVATIONS values.
[[nodiscard]] std::optional<double> decayed_score(std::span<const double> recent_first,
                                                  double alpha) noexcept;

/// Legacy fixed-weight average: the table is truncated to the games
/// available and renormalized. nullopt when fewer than MIN_FORM_OBSERVATIONS
/// values or the truncated weights sum to zero.
[[nodiscard]] std::optional<double> fixed_weight_score(std::span<const double> recent_first,
                                                       std::span<const double> weights) noexcept;

// ─── Multiplier Policies ──────────────────────────────────────────────────────

/// Weighted recent score / blended baseline, clamped to the effective form
/// bounds. Only the first `lookback` values of `recent_first` are used.
[[nodiscard]] MultiplierResult form_multiplier(std::span<const double> recent_first,
                                               double blended_baseline,
                                               const ParameterSet& params) noexcept;

[[nodiscard]] MultiplierResult fixture_multiplier(std::optional<double> difficulty,
                                                  Position position,
                                                  const ParameterSet& params) noexcept;

[[nodiscard]] MultiplierResult ratio_multiplier(std::optional<double> current_rate,
                                                std::optional<double> baseline_rate,
                                                Position position,
                                                const ParameterSet& params) noexcept;

/// Not clamped: ruled out is exactly 0.0. `manual` wins over `imported`;
/// neither present falls back to the rotation penalty.
[[nodiscard]] MultiplierResult starter_multiplier(std::optional<StarterStatus> imported,
                                                  std::optional<StarterStatus> manual,
                                                  const ParameterSet& params) noexcept;

// ─── FormulaEngine ────────────────────────────────────────────────────────────

/// Usage
/// -----
/// ```cpp
/// FormulaEngine engine(ParameterSet::defaults());
/// Prediction p = engine.evaluate(history, 12);
/// fmt::print("{}\n", p.to_string());
/// ```
class FormulaEngine {
public:
    /// Throws InvalidParameterSet if `params` fails validate().
    explicit FormulaEngine(ParameterSet params);

    /// Evaluate `history` as of `as_of`. History entries may arrive in any
    /// order. When a period appears at several revisions only the highest
    /// one is used. The latest period supplies the context signals (price,
    /// fixture, starter, shot rates).
    ///
    /// @throws LookaheadViolation if any snapshot has period > as_of.
    [[nodiscard]] Prediction evaluate(const PlayerHistory& history, Period as_of) const;

    [[nodiscard]] const ParameterSet& parameters() const noexcept { return params_; }

private:
    ParameterSet params_;
};

/// Convenience: validate `params` and evaluate once.
[[nodiscard]] Prediction evaluate(const PlayerHistory& history,
                                  const ParameterSet& params,
                                  Period as_of);

} // namespace fvh::formula
