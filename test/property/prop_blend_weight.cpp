/**
 * @file  prop_blend_weight.cpp
 * @brief Property: ∀ N ≥ 1, K ≥ 2: w(N, K) ∈ [0, 1], w(1, K) = 0,
 *        w(N, K) = 1 for N ≥ K, and w is non-decreasing in N.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_blend_weight
 *
 * Mathematical basis:
 *   w(N, K) = min(1, (N − 1) / (K − 1))
 *   blended = w·current + (1 − w)·prior, so the blended baseline always lies
 *   between the prior and the current average (before the floor).
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>

#include "fvh/formula.hpp"

using namespace fvh;
using namespace fvh::formula;

int main() {
    // ── Property 1: w ∈ [0, 1], monotone in N ───────────────────────────────
    rc::check(
        "blend_weight: bounded and non-decreasing in the period",
        [] {
            const int horizon = *rc::gen::inRange(2, 60);
            const int period  = *rc::gen::inRange(1, 80);

            const double w      = blend_weight(period, horizon);
            const double w_next = blend_weight(period + 1, horizon);
            RC_ASSERT(w >= 0.0);
            RC_ASSERT(w <= 1.0);
            RC_ASSERT(w_next >= w);
        }
    );

    // ── Property 2: endpoints ────────────────────────────────────────────────
    rc::check(
        "blend_weight: zero at the first period, one from the horizon on",
        [] {
            const int horizon = *rc::gen::inRange(2, 60);
            const int extra   = *rc::gen::inRange(0, 40);
            RC_ASSERT(blend_weight(1, horizon) == 0.0);
            RC_ASSERT(blend_weight(horizon + extra, horizon) == 1.0);
        }
    );

    // ── Property 3: blended baseline lies between prior and current ─────────
    rc::check(
        "blend_baseline: convex combination of prior and current, floored",
        [](double raw_prior, double raw_current) {
            const double prior   = 10.0 * (std::tanh(raw_prior) + 1.0);
            const double current = 10.0 * (std::tanh(raw_current) + 1.0);
            const Period period  = *rc::gen::inRange(1, 40);
            const ParameterSet params = ParameterSet::defaults();

            const BlendResult b = blend_baseline(prior, current, period, params);
            const double lo = std::max(std::min(prior, current), params.baseline_floor);
            const double hi = std::max(std::max(prior, current), params.baseline_floor);
            RC_ASSERT(b.baseline >= lo - 1e-12);
            RC_ASSERT(b.baseline <= hi + 1e-12);
            RC_ASSERT(b.weight == blend_weight(period, params.adaptation_horizon));
        }
    );

    return 0;
}
