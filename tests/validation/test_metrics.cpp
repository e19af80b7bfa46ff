#include <gtest/gtest.h>
#include "fvh/metrics.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace fvh;
using namespace fvh::validation;

namespace {

PredictionOutcome pair_of(const std::string& player, double predicted, double actual, Period period = 1) {
    PredictionOutcome po;
    po.prediction.player_id   = player;
    po.prediction.period      = period;
    po.prediction.final_value = predicted;
    po.actual                 = actual;
    return po;
}

} // anonymous namespace

// ─── Error statistics ─────────────────────────────────────────────────────────

TEST(Metrics, ErrorStatistics_KnownValues) {
    const std::vector<double> predicted{1.0, 2.0, 3.0};
    const std::vector<double> actual{2.0, 2.0, 5.0};

    EXPECT_NEAR(*MetricsCalculator::rmse(predicted, actual), std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_NEAR(*MetricsCalculator::mae(predicted, actual), 1.0, 1e-12);
    EXPECT_NEAR(*MetricsCalculator::bias(predicted, actual), 1.0, 1e-12);
    EXPECT_NEAR(*MetricsCalculator::r_squared(predicted, actual), 1.0 / 6.0, 1e-12);
}

TEST(Metrics, ErrorStatistics_RejectUnusableInput) {
    const std::vector<double> two{1.0, 2.0};
    const std::vector<double> three{1.0, 2.0, 3.0};
    const std::vector<double> with_nan{1.0, std::numeric_limits<double>::quiet_NaN(), 3.0};

    EXPECT_FALSE(MetricsCalculator::rmse(two, three).has_value());
    EXPECT_FALSE(MetricsCalculator::mae({}, {}).has_value());
    EXPECT_FALSE(MetricsCalculator::bias(with_nan, three).has_value());
    EXPECT_FALSE(MetricsCalculator::r_squared(three, std::vector<double>{4.0, 4.0, 4.0}).has_value());
}

TEST(Metrics, PerfectPrediction) {
    const std::vector<double> v{3.0, 1.0, 4.0, 1.5};
    EXPECT_DOUBLE_EQ(*MetricsCalculator::rmse(v, v), 0.0);
    EXPECT_DOUBLE_EQ(*MetricsCalculator::r_squared(v, v), 1.0);
}

// ─── Ranks ────────────────────────────────────────────────────────────────────

TEST(Metrics, AverageRanks_TiesShareMean) {
    const std::vector<double> values{10.0, 20.0, 20.0, 30.0};
    EXPECT_EQ(MetricsCalculator::average_ranks(values), (std::vector<double>{1.0, 2.5, 2.5, 4.0}));

    const std::vector<double> unsorted{3.0, 1.0, 2.0};
    EXPECT_EQ(MetricsCalculator::average_ranks(unsorted), (std::vector<double>{3.0, 1.0, 2.0}));
}

TEST(Metrics, Spearman_KnownValueAndSignificance) {
    const std::vector<double> x{1, 2, 3, 4, 5};
    const std::vector<double> y{2, 1, 4, 3, 5};
    const auto rho = MetricsCalculator::spearman(x, y);
    EXPECT_NEAR(rho.coefficient, 0.8, 1e-12);
    EXPECT_NEAR(rho.p_value, 0.1041, 1e-3);
}

TEST(Metrics, Spearman_PerfectAndReversed) {
    const std::vector<double> x{1, 2, 3, 4};
    const std::vector<double> up{10, 20, 30, 40};
    const std::vector<double> down{40, 30, 20, 10};

    const auto a = MetricsCalculator::spearman(x, up);
    EXPECT_DOUBLE_EQ(a.coefficient, 1.0);
    EXPECT_DOUBLE_EQ(a.p_value, 0.0);

    const auto b = MetricsCalculator::spearman(x, down);
    EXPECT_DOUBLE_EQ(b.coefficient, -1.0);
}

TEST(Metrics, Spearman_DegenerateGivesZeroAndOne) {
    const std::vector<double> x{1, 2, 3, 4};
    const std::vector<double> flat{5, 5, 5, 5};
    const auto a = MetricsCalculator::spearman(x, flat);
    EXPECT_DOUBLE_EQ(a.coefficient, 0.0);
    EXPECT_DOUBLE_EQ(a.p_value, 1.0);

    const std::vector<double> two{1, 2};
    const auto b = MetricsCalculator::spearman(two, two);
    EXPECT_DOUBLE_EQ(b.coefficient, 0.0);
    EXPECT_DOUBLE_EQ(b.p_value, 1.0);
}

// ─── Precision@K ──────────────────────────────────────────────────────────────

TEST(Metrics, PrecisionAtK_Overlap) {
    const std::vector<PredictionOutcome> pairs{
        pair_of("a", 4.0, 1.0),
        pair_of("b", 3.0, 4.0),
        pair_of("c", 2.0, 3.0),
        pair_of("d", 1.0, 2.0),
    };
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 2), 0.5);
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 1), 0.0);
    // K larger than the sample is reduced to it.
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 10), 1.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 0), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k({}, 5), 0.0);
}

TEST(Metrics, PrecisionAtK_TiesBrokenByPlayer) {
    const std::vector<PredictionOutcome> pairs{
        pair_of("b", 5.0, 9.0),
        pair_of("a", 5.0, 1.0),
        pair_of("c", 1.0, 2.0),
    };
    // The predicted tie is ordered by id, so "a" leads.
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 1), 0.0);
    EXPECT_DOUBLE_EQ(MetricsCalculator::precision_at_k(pairs, 2), 0.5);
}

// ─── compute ──────────────────────────────────────────────────────────────────

TEST(Metrics, Compute_AllFields) {
    const std::vector<PredictionOutcome> pairs{
        pair_of("a", 1.0, 2.0),
        pair_of("b", 2.0, 2.0),
        pair_of("c", 3.0, 5.0),
    };
    const auto m = MetricsCalculator::compute(pairs, MetricsConfig{.top_k = 2, .min_sample = 3});
    EXPECT_TRUE(m.sufficient);
    EXPECT_EQ(m.sample_size, 3u);
    EXPECT_NEAR(m.rmse, std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_NEAR(m.mae, 1.0, 1e-12);
    EXPECT_NEAR(m.bias, 1.0, 1e-12);
    EXPECT_NEAR(m.r_squared, 1.0 / 6.0, 1e-12);
    EXPECT_EQ(m.k, 2u);
    EXPECT_NEAR(m.mean_predicted, 2.0, 1e-12);
    EXPECT_NEAR(m.mean_actual, 3.0, 1e-12);
    EXPECT_GE(m.rmse, m.mae);
    EXPECT_NE(m.to_string().find("n=3"), std::string::npos);
}

TEST(Metrics, Compute_InsufficientSampleIsZeroed) {
    const std::vector<PredictionOutcome> pairs{
        pair_of("a", 1.0, 7.0),
        pair_of("b", 2.0, 0.0),
    };
    const auto m = MetricsCalculator::compute(pairs);
    EXPECT_FALSE(m.sufficient);
    EXPECT_EQ(m.sample_size, 2u);
    EXPECT_DOUBLE_EQ(m.rmse, 0.0);
    EXPECT_DOUBLE_EQ(m.mae, 0.0);
    EXPECT_DOUBLE_EQ(m.spearman_p_value, 1.0);
    EXPECT_EQ(m.k, 0u);
    EXPECT_NE(m.to_string().find("insufficient"), std::string::npos);
}

TEST(Metrics, Compute_DropsNonFinitePairs) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<PredictionOutcome> pairs{
        pair_of("a", 1.0, 2.0),
        pair_of("b", nan, 2.0),
        pair_of("c", 2.0, 2.0),
        pair_of("d", 3.0, std::numeric_limits<double>::infinity()),
        pair_of("e", 3.0, 5.0),
    };
    const auto m = MetricsCalculator::compute(pairs);
    EXPECT_TRUE(m.sufficient);
    EXPECT_EQ(m.sample_size, 3u);
    EXPECT_NEAR(m.rmse, std::sqrt(5.0 / 3.0), 1e-12);
}

TEST(Metrics, Compute_RmseNeverBelowMae) {
    // Equal absolute errors: RMSE and MAE coincide mathematically.
    std::vector<PredictionOutcome> pairs;
    for (int i = 0; i < 50; ++i) {
        const double predicted = 0.1 * i;
        pairs.push_back(pair_of("p" + std::to_string(i), predicted, predicted + (i % 2 ? 0.3 : -0.3)));
    }
    const auto m = MetricsCalculator::compute(pairs);
    EXPECT_GE(m.rmse, m.mae);
    EXPECT_NEAR(m.mae, 0.3, 1e-12);
}
