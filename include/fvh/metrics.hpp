#pragma once

/// @file include/fvh/metrics.hpp
/// @brief Accuracy metrics of predictions against realized outcomes.
///
/// # Module: Validation Metrics
///
/// ## Responsibility
/// Reduce (Prediction, realized points) pairs to the standard statistics:
///   - RMSE, MAE and mean bias (actual - predicted)
///   - R² = 1 - SS_res / SS_tot
///   - Spearman rank correlation with average ranks for ties and a two-sided
///     Student-t significance value
///   - Precision@K: overlap of the predicted and actual top-K sets
///
/// ## Guarantees
/// - Non-finite pairs are dropped before any statistic is computed
/// - RMSE >= MAE for every sufficient sample
/// - A NaN rank correlation is reported as 0 with p = 1
/// - Below the minimum sample size every statistic is zeroed, p = 1 and
///   `sufficient` is false; sample_size is always reported
///
/// ## NOT Responsible For
/// - Producing predictions (see formula.hpp, validation.hpp)

#include "fvh/constants.hpp"
#include "fvh/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fvh::validation {

// ─── Types ────────────────────────────────────────────────────────────────────

/// One prediction paired with what the player actually scored.
struct PredictionOutcome {
    Prediction prediction;
    double     actual = 0.0;
};

struct RankCorrelation {
    double coefficient = 0.0;
    double p_value     = 1.0;
};

struct MetricsConfig {
    std::size_t top_k      = constants::DEFAULT_TOP_K;
    std::size_t min_sample = constants::MIN_METRICS_SAMPLE;

    bool operator==(const MetricsConfig&) const = default;
};

struct ValidationMetrics {
    std::size_t sample_size      = 0;
    double      rmse             = 0.0;
    double      mae              = 0.0;
    double      bias             = 0.0;  ///< mean(actual - predicted)
    double      r_squared        = 0.0;
    double      spearman         = 0.0;
    double      spearman_p_value = 1.0;
    double      precision_at_k   = 0.0;
    std::size_t k                = 0;    ///< K actually used
    double      mean_predicted   = 0.0;
    double      mean_actual      = 0.0;
    bool        sufficient       = false;

    bool operator==(const ValidationMetrics&) const = default;

    /// Human-readable summary line.
    [[nodiscard]] std::string to_string() const;
};

// ─── MetricsCalculator ────────────────────────────────────────────────────────

/// Stateless; all methods are static and take parallel spans of predicted
/// and actual values. Mismatched lengths, empty input or non-finite values
/// give nullopt where a result is optional.
class MetricsCalculator {
public:
    [[nodiscard]] static std::optional<double>
    rmse(std::span<const double> predicted, std::span<const double> actual) noexcept;

    [[nodiscard]] static std::optional<double>
    mae(std::span<const double> predicted, std::span<const double> actual) noexcept;

    /// mean(actual - predicted)
    [[nodiscard]] static std::optional<double>
    bias(std::span<const double> predicted, std::span<const double> actual) noexcept;

    /// nullopt when the actual values have zero variance.
    [[nodiscard]] static std::optional<double>
    r_squared(std::span<const double> predicted, std::span<const double> actual) noexcept;

    /// 1-based ranks; tied values share the mean of the ranks they span.
    [[nodiscard]] static std::vector<double> average_ranks(std::span<const double> values);

    /// Pearson correlation of the average ranks, with
    ///   t = r sqrt((n - 2) / (1 - r²)),  p = 2 P(T_{n-2} > |t|).
    /// Fewer than 3 values or a degenerate (NaN) coefficient give {0, 1}.
    [[nodiscard]] static RankCorrelation
    spearman(std::span<const double> predicted, std::span<const double> actual);

    /// |top-K by prediction ∩ top-K by actual| / K, with K reduced to the
    /// sample size. Equal values are ordered by (player, period). 0 for an
    /// empty sample or K = 0.
    [[nodiscard]] static double
    precision_at_k(std::span<const PredictionOutcome> pairs, std::size_t k);

    /// Every statistic at once, honoring `config.min_sample`.
    [[nodiscard]] static ValidationMetrics
    compute(std::span<const PredictionOutcome> pairs, const MetricsConfig& config = {});
};

} // namespace fvh::validation
