/// @file src/validation/metrics.cpp
/// @brief MetricsCalculator: error, correlation and ranking statistics.
///
/// Aggregation runs on Eigen column vectors mapped over the caller's spans;
/// the error statistics evaluate lazily and never allocate.
/// The Spearman significance uses the Student-t distribution from
/// Boost.Math with n - 2 degrees of freedom.

#include "fvh/metrics.hpp"
#include "fvh/constants.hpp"

#include <Eigen/Dense>
#include <boost/math/distributions/students_t.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <tuple>

namespace fvh::validation {

namespace {

using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

[[nodiscard]] bool usable(std::span<const double> predicted, std::span<const double> actual) noexcept {
    return !predicted.empty() && predicted.size() == actual.size() &&
           all_finite(predicted) && all_finite(actual);
}

ConstVectorMap as_vector(std::span<const double> v) noexcept {
    return ConstVectorMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

/// Ordering for ranking lists: value descending, then (player, period).
std::vector<std::size_t> order_by(std::span<const PredictionOutcome> pairs, bool by_prediction) {
    std::vector<std::size_t> idx(pairs.size());
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
        const auto& pa = pairs[a];
        const auto& pb = pairs[b];
        const double va = by_prediction ? pa.prediction.final_value : pa.actual;
        const double vb = by_prediction ? pb.prediction.final_value : pb.actual;
        if (va != vb) return va > vb;
        return std::tie(pa.prediction.player_id, pa.prediction.period) <
               std::tie(pb.prediction.player_id, pb.prediction.period);
    });
    return idx;
}

} // anonymous namespace

// ─── Error statistics ─────────────────────────────────────────────────────────

std::optional<double>
MetricsCalculator::rmse(std::span<const double> predicted, std::span<const double> actual) noexcept {
    if (!usable(predicted, actual)) return std::nullopt;
    const double ss = (as_vector(actual) - as_vector(predicted)).squaredNorm();
    return std::sqrt(ss / static_cast<double>(predicted.size()));
}

std::optional<double>
MetricsCalculator::mae(std::span<const double> predicted, std::span<const double> actual) noexcept {
    if (!usable(predicted, actual)) return std::nullopt;
    return (as_vector(actual) - as_vector(predicted)).cwiseAbs().mean();
}

std::optional<double>
MetricsCalculator::bias(std::span<const double> predicted, std::span<const double> actual) noexcept {
    if (!usable(predicted, actual)) return std::nullopt;
    return (as_vector(actual) - as_vector(predicted)).mean();
}

std::optional<double>
MetricsCalculator::r_squared(std::span<const double> predicted, std::span<const double> actual) noexcept {
    if (!usable(predicted, actual)) return std::nullopt;
    const auto   a      = as_vector(actual);
    const double ss_tot = (a.array() - a.mean()).square().sum();
    if (ss_tot <= constants::FLOAT_EPSILON) return std::nullopt;
    const double ss_res = (as_vector(actual) - as_vector(predicted)).squaredNorm();
    return 1.0 - ss_res / ss_tot;
}

// ─── Rank correlation ─────────────────────────────────────────────────────────

std::vector<double> MetricsCalculator::average_ranks(std::span<const double> values) {
    const std::size_t n = values.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), std::size_t{0});
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t a, std::size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n, 0.0);
    std::size_t i = 0;
    while (i < n) {
        std::size_t j = i + 1;
        while (j < n && values[idx[j]] == values[idx[i]]) ++j;
        // Ranks i+1 .. j share their mean.
        const double shared = (static_cast<double>(i + 1) + static_cast<double>(j)) / 2.0;
        for (std::size_t k = i; k < j; ++k) ranks[idx[k]] = shared;
        i = j;
    }
    return ranks;
}

RankCorrelation
MetricsCalculator::spearman(std::span<const double> predicted, std::span<const double> actual) {
    if (!usable(predicted, actual) || predicted.size() < 3) return RankCorrelation{};

    const std::vector<double> rp = average_ranks(predicted);
    const std::vector<double> ra = average_ranks(actual);
    const Eigen::VectorXd x = (as_vector(rp).array() - as_vector(rp).mean()).matrix();
    const Eigen::VectorXd y = (as_vector(ra).array() - as_vector(ra).mean()).matrix();

    const double denom = std::sqrt(x.squaredNorm() * y.squaredNorm());
    if (!(denom > 0.0)) return RankCorrelation{};  // constant ranks: coefficient undefined

    const double r = std::clamp(x.dot(y) / denom, -1.0, 1.0);
    if (!std::isfinite(r)) return RankCorrelation{};

    const double df = static_cast<double>(predicted.size() - 2);
    if (std::abs(r) >= 1.0) return RankCorrelation{.coefficient = r, .p_value = 0.0};

    const double t = r * std::sqrt(df / (1.0 - r * r));
    const boost::math::students_t dist(df);
    const double p = 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
    return RankCorrelation{.coefficient = r, .p_value = std::clamp(p, 0.0, 1.0)};
}

// ─── Precision@K ──────────────────────────────────────────────────────────────

double MetricsCalculator::precision_at_k(std::span<const PredictionOutcome> pairs, std::size_t k) {
    k = std::min(k, pairs.size());
    if (k == 0) return 0.0;

    const auto by_pred   = order_by(pairs, true);
    const auto by_actual = order_by(pairs, false);
    const std::set<std::size_t> top_actual(by_actual.begin(), by_actual.begin() + static_cast<std::ptrdiff_t>(k));

    std::size_t hits = 0;
    for (std::size_t i = 0; i < k; ++i) {
        if (top_actual.count(by_pred[i]) != 0) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(k);
}

// ─── All at once ──────────────────────────────────────────────────────────────

ValidationMetrics
MetricsCalculator::compute(std::span<const PredictionOutcome> pairs, const MetricsConfig& config) {
    std::vector<PredictionOutcome> kept;
    kept.reserve(pairs.size());
    for (const auto& p : pairs) {
        if (std::isfinite(p.prediction.final_value) && std::isfinite(p.actual)) kept.push_back(p);
    }

    ValidationMetrics m;
    m.sample_size = kept.size();
    if (kept.empty() || kept.size() < config.min_sample) {
        return m;
    }

    std::vector<double> predicted;
    std::vector<double> actual;
    predicted.reserve(kept.size());
    actual.reserve(kept.size());
    for (const auto& p : kept) {
        predicted.push_back(p.prediction.final_value);
        actual.push_back(p.actual);
    }

    m.mae  = mae(predicted, actual).value_or(0.0);
    // RMSE >= MAE holds exactly; rounding in sqrt must not break it.
    m.rmse = std::max(rmse(predicted, actual).value_or(0.0), m.mae);
    m.bias = bias(predicted, actual).value_or(0.0);
    m.r_squared = r_squared(predicted, actual).value_or(0.0);

    const RankCorrelation rho = spearman(predicted, actual);
    m.spearman         = rho.coefficient;
    m.spearman_p_value = rho.p_value;

    m.k              = std::min(config.top_k, kept.size());
    m.precision_at_k = precision_at_k(kept, m.k);
    m.mean_predicted = as_vector(predicted).mean();
    m.mean_actual    = as_vector(actual).mean();
    m.sufficient     = true;
    return m;
}

// ─── ValidationMetrics ────────────────────────────────────────────────────────

std::string ValidationMetrics::to_string() const {
    if (!sufficient) {
        return fmt::format("n={} (insufficient sample)", sample_size);
    }
    return fmt::format(
        "n={} RMSE={:.3f} MAE={:.3f} bias={:+.3f} R²={:.3f} "
        "spearman={:.3f} (p={:.4f}) precision@{}={:.3f} mean_pred={:.3f} mean_actual={:.3f}",
        sample_size, rmse, mae, bias, r_squared, spearman, spearman_p_value,
        k, precision_at_k, mean_predicted, mean_actual);
}

} // namespace fvh::validation
