/// @file src/validation/cross_validation.cpp
/// @brief Consecutive-fold cross-validation with forward-only training.
///
/// For a tested period t in a fold, the training set is every period
/// outside the fold that precedes t. Later periods are never used, so a
/// fold can only train on what was known when it was played.

#include "fvh/validation.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace fvh::validation {

namespace {

struct MeanStd {
    double mean = 0.0;
    double std  = 0.0;
};

/// Mean and sample (n - 1) standard deviation; std is 0 below two values.
MeanStd mean_std(const std::vector<double>& v) noexcept {
    if (v.empty()) return {};
    const double n    = static_cast<double>(v.size());
    const double mean = std::accumulate(v.begin(), v.end(), 0.0) / n;
    if (v.size() < 2) return MeanStd{mean, 0.0};
    double sq = 0.0;
    for (const double x : v) sq += (x - mean) * (x - mean);
    return MeanStd{mean, std::sqrt(sq / (n - 1.0))};
}

} // anonymous namespace

std::string CrossValidationReport::to_string() const {
    std::string out = fmt::format(
        "{} folds ({} aggregated, {} skipped)\n"
        "RMSE      {:.4f} ± {:.4f}\n"
        "MAE       {:.4f} ± {:.4f}\n"
        "Spearman  {:.4f} ± {:.4f}",
        folds.size(), aggregated_folds, skipped_folds,
        mean_rmse, std_rmse, mean_mae, std_mae, mean_spearman, std_spearman);
    for (std::size_t i = 0; i < folds.size(); ++i) {
        const auto& f = folds[i];
        out += fmt::format("\n  fold {} periods {}: {}", i + 1,
                           fmt::join(f.test_periods, ","), f.metrics.to_string());
    }
    return out;
}

CrossValidationReport ValidationEngine::cross_validate(std::span<const Period> periods,
                                                       const ParameterSet& params,
                                                       const CrossValidationConfig& config) const {
    validate(params);

    std::vector<Period> sorted(periods.begin(), periods.end());
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    CrossValidationReport report;
    const std::size_t fold_size = std::max<std::size_t>(config.fold_size, 1);

    std::vector<double> rmse;
    std::vector<double> mae;
    std::vector<double> rho;

    for (std::size_t start = 0; start < sorted.size(); start += fold_size) {
        const std::size_t end = std::min(start + fold_size, sorted.size());

        // Complement of the fold, restricted to periods before it.
        const std::span<const Period> train(sorted.data(), start);
        if (train.size() < config.min_train_periods) {
            ++report.skipped_folds;
            continue;
        }

        FoldResult fold;
        std::vector<PredictionOutcome> pairs;
        for (std::size_t i = start; i < end; ++i) {
            BacktestResult bt = run_backtest(train, sorted[i], params);
            fold.test_periods.push_back(sorted[i]);
            std::move(bt.pairs.begin(), bt.pairs.end(), std::back_inserter(pairs));
        }

        fold.metrics = MetricsCalculator::compute(pairs, config.metrics);
        if (fold.metrics.sufficient) {
            rmse.push_back(fold.metrics.rmse);
            mae.push_back(fold.metrics.mae);
            rho.push_back(fold.metrics.spearman);
        }
        report.folds.push_back(std::move(fold));
    }

    report.aggregated_folds = rmse.size();
    const auto r = mean_std(rmse);
    const auto m = mean_std(mae);
    const auto s = mean_std(rho);
    report.mean_rmse     = r.mean;
    report.std_rmse      = r.std;
    report.mean_mae      = m.mean;
    report.std_mae       = m.std;
    report.mean_spearman = s.mean;
    report.std_spearman  = s.std;
    return report;
}

} // namespace fvh::validation
