/**
 * @file  prop_rmse_mae.cpp
 * @brief Property: ∀ finite paired samples with n ≥ min_sample:
 *        RMSE ≥ MAE ≥ 0, |bias| ≤ MAE, and Spearman ρ ∈ [−1, 1] with p ∈ [0, 1].
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_rmse_mae
 *
 * Mathematical basis:
 *   By Cauchy–Schwarz, mean(|e|)² ≤ mean(e²), so MAE ≤ RMSE.
 */

#include <rapidcheck.h>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "fvh/metrics.hpp"

using namespace fvh;
using namespace fvh::validation;

int main() {
    rc::check(
        "metrics: rmse >= mae >= |bias|, rank correlation in range",
        [](std::vector<std::pair<int, int>> raw) {
            RC_PRE(raw.size() >= 3);

            std::vector<PredictionOutcome> pairs;
            for (std::size_t i = 0; i < raw.size(); ++i) {
                PredictionOutcome po;
                po.prediction.player_id   = "p" + std::to_string(i);
                po.prediction.period      = 1;
                po.prediction.final_value = static_cast<double>(raw[i].first % 1000) / 10.0;
                po.actual                 = static_cast<double>(raw[i].second % 1000) / 10.0;
                pairs.push_back(po);
            }

            const ValidationMetrics m = MetricsCalculator::compute(pairs);
            RC_ASSERT(m.sufficient);
            RC_ASSERT(m.sample_size == pairs.size());
            RC_ASSERT(m.mae >= 0.0);
            RC_ASSERT(m.rmse >= m.mae);
            RC_ASSERT(std::abs(m.bias) <= m.mae + 1e-9);
            RC_ASSERT(m.spearman >= -1.0);
            RC_ASSERT(m.spearman <= 1.0);
            RC_ASSERT(m.spearman_p_value >= 0.0);
            RC_ASSERT(m.spearman_p_value <= 1.0);
            RC_ASSERT(m.precision_at_k >= 0.0);
            RC_ASSERT(m.precision_at_k <= 1.0);
        }
    );

    return 0;
}
