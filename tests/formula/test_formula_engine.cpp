#include <gtest/gtest.h>
#include "fvh/errors.hpp"
#include "fvh/formula.hpp"
#include "support/league.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iterator>
#include <vector>

using namespace fvh;
using namespace fvh::formula;
using fvh::testing::full_snapshot;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static PlayerHistory steady_history(Period periods, double points) {
    PlayerHistory h{.player_id = "steady", .snapshots = {}};
    for (Period p = 1; p <= periods; ++p) {
        h.snapshots.push_back(full_snapshot("steady", p, points));
    }
    return h;
}

static bool has(const Prediction& p, DataQualityIssue issue) {
    return p.has_issue(issue);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(FormulaEngine, InvalidParameters_RejectedAtConstruction) {
    ParameterSet p = ParameterSet::defaults();
    p.decay_rate = 1.0;
    EXPECT_THROW(FormulaEngine{p}, InvalidParameterSet);
    EXPECT_THROW((void)evaluate(steady_history(3, 5.0), p, 3), InvalidParameterSet);
}

// ─── Combination ─────────────────────────────────────────────────────────────

TEST(FormulaEngine, CleanHistory_ProductOfMultipliers) {
    const FormulaEngine engine(ParameterSet::defaults());
    const Prediction p = engine.evaluate(steady_history(8, 7.2), 8);

    EXPECT_TRUE(p.data_quality.empty());
    EXPECT_EQ(p.player_id, "steady");
    EXPECT_EQ(p.period, 8);
    EXPECT_EQ(p.parameter_set, "default@v1");
    EXPECT_NEAR(p.blend_weight, 7.0 / 15.0, 1e-12);
    EXPECT_NEAR(p.blended_baseline, 6.4533, 1e-4);
    EXPECT_NEAR(p.form_multiplier, 7.2 / p.blended_baseline, 1e-9);
    EXPECT_DOUBLE_EQ(p.fixture_multiplier, 1.0);
    EXPECT_DOUBLE_EQ(p.ratio_multiplier, 1.0);
    EXPECT_DOUBLE_EQ(p.starter_multiplier, 1.0);
    EXPECT_NEAR(p.final_value,
                p.blended_baseline * p.form_multiplier * p.fixture_multiplier *
                    p.starter_multiplier * p.ratio_multiplier,
                1e-12);
    EXPECT_DOUBLE_EQ(p.price_used, 8.0);
    EXPECT_NEAR(p.value_per_price, p.final_value / 8.0, 1e-12);
    EXPECT_FALSE(p.global_cap_applied);
}

TEST(FormulaEngine, SingleObservation_FormExactlyNeutral) {
    const FormulaEngine engine(ParameterSet::defaults());
    const Prediction p = engine.evaluate(steady_history(1, 11.0), 1);
    EXPECT_EQ(p.form_multiplier, 1.0);
    EXPECT_TRUE(has(p, DataQualityIssue::InsufficientFormHistory));
    EXPECT_DOUBLE_EQ(p.blended_baseline, 5.8);  // w = 0 at period 1
}

TEST(FormulaEngine, GlobalCap_LimitsFinalValue) {
    PlayerHistory h{.player_id = "hot", .snapshots = {}};
    for (Period p = 1; p <= 2; ++p) {
        RawSnapshot s = full_snapshot("hot", p, 30.0);
        s.position           = Position::Forward;
        s.prior_baseline     = 1.0;
        s.fixture_difficulty = -10.0;
        s.shot_rate          = 3.0;
        s.shot_rate_baseline = 1.0;
        h.snapshots.push_back(s);
    }
    const ParameterSet params = ParameterSet::defaults();
    const Prediction p = FormulaEngine(params).evaluate(h, 2);

    EXPECT_TRUE(p.global_cap_applied);
    EXPECT_DOUBLE_EQ(p.final_value, p.blended_baseline * params.global_cap);
    EXPECT_DOUBLE_EQ(p.form_multiplier, 2.0);
    EXPECT_DOUBLE_EQ(p.ratio_multiplier, 2.5);
}

TEST(FormulaEngine, MultipliersAlwaysWithinEffectiveBounds) {
    ParameterSet params = ParameterSet::defaults();
    params.form_cap  = MultiplierBounds{0.6, 1.8};
    params.ratio_cap = MultiplierBounds{0.4, 2.5};
    const FormulaEngine engine(params);

    for (std::size_t i = 0; i < 24; ++i) {
        PlayerHistory h{.player_id = fvh::testing::player_name(i), .snapshots = {}};
        for (Period p = 1; p <= 10; ++p) {
            h.snapshots.push_back(fvh::testing::league_snapshot(i, p));
        }
        for (Period as_of = 1; as_of <= 10; ++as_of) {
            PlayerHistory visible{.player_id = h.player_id, .snapshots = {}};
            std::copy_if(h.snapshots.begin(), h.snapshots.end(), std::back_inserter(visible.snapshots),
                         [as_of](const RawSnapshot& s) { return s.period <= as_of; });
            const Prediction pr = engine.evaluate(visible, as_of);
            EXPECT_TRUE(params.effective_form_bounds().contains(pr.form_multiplier));
            EXPECT_TRUE(params.effective_fixture_bounds().contains(pr.fixture_multiplier));
            EXPECT_TRUE(params.effective_ratio_bounds().contains(pr.ratio_multiplier));
            EXPECT_LE(pr.final_value, pr.blended_baseline * params.global_cap);
            EXPECT_GE(pr.blended_baseline, params.baseline_floor);
        }
    }
}

// ─── Determinism ─────────────────────────────────────────────────────────────

TEST(FormulaEngine, IdenticalInputs_BitIdenticalOutput) {
    const FormulaEngine a(ParameterSet::defaults());
    const FormulaEngine b(ParameterSet::defaults());
    PlayerHistory h{.player_id = "p07", .snapshots = {}};
    for (Period p = 1; p <= 12; ++p) h.snapshots.push_back(fvh::testing::league_snapshot(7, p));

    const Prediction first  = a.evaluate(h, 12);
    const Prediction second = b.evaluate(h, 12);
    EXPECT_EQ(first, second);
    EXPECT_EQ(std::memcmp(&first.final_value, &second.final_value, sizeof(double)), 0);
}

TEST(FormulaEngine, SnapshotOrderDoesNotMatter) {
    PlayerHistory h{.player_id = "p03", .snapshots = {}};
    for (Period p = 1; p <= 9; ++p) h.snapshots.push_back(fvh::testing::league_snapshot(3, p));
    PlayerHistory reversed = h;
    std::reverse(reversed.snapshots.begin(), reversed.snapshots.end());

    const FormulaEngine engine(ParameterSet::defaults());
    EXPECT_EQ(engine.evaluate(h, 9), engine.evaluate(reversed, 9));
}

TEST(FormulaEngine, CorrectedPeriod_ReplacesStaleRevision) {
    PlayerHistory corrected{.player_id = "fix", .snapshots = {}};
    corrected.snapshots.push_back(full_snapshot("fix", 1, 2.0));
    corrected.snapshots.push_back(full_snapshot("fix", 2, 10.0));
    corrected.snapshots.back().revision = 1;

    PlayerHistory with_stale = corrected;
    RawSnapshot stale = full_snapshot("fix", 2, 2.0);
    stale.price = 4.0;
    with_stale.snapshots.insert(with_stale.snapshots.begin() + 1, stale);

    const FormulaEngine engine(ParameterSet::defaults());
    const Prediction expected = engine.evaluate(corrected, 2);
    EXPECT_EQ(engine.evaluate(with_stale, 2), expected);

    PlayerHistory reversed = with_stale;
    std::reverse(reversed.snapshots.begin(), reversed.snapshots.end());
    EXPECT_EQ(engine.evaluate(reversed, 2), expected);
    EXPECT_DOUBLE_EQ(expected.price_used, 8.0);
}

// ─── Look-ahead ──────────────────────────────────────────────────────────────

TEST(FormulaEngine, FutureSnapshot_ThrowsLookahead) {
    const FormulaEngine engine(ParameterSet::defaults());
    const PlayerHistory h = steady_history(6, 5.0);
    try {
        (void)engine.evaluate(h, 4);
        FAIL() << "expected LookaheadViolation";
    } catch (const LookaheadViolation& e) {
        EXPECT_EQ(e.as_of(), 4);
        EXPECT_EQ(e.offending_period(), 5);
    }
}

// ─── Missing data ────────────────────────────────────────────────────────────

TEST(FormulaEngine, BareSnapshot_DegradesToNeutralWithEvents) {
    PlayerHistory h{.player_id = "bare", .snapshots = {}};
    RawSnapshot s;
    s.player_id = "bare";
    s.period    = 3;
    s.position  = Position::Midfielder;
    h.snapshots.push_back(s);

    const ParameterSet params = ParameterSet::defaults();
    const Prediction p = FormulaEngine(params).evaluate(h, 3);

    EXPECT_DOUBLE_EQ(p.blended_baseline, params.default_prior_baseline);
    EXPECT_EQ(p.form_multiplier, 1.0);
    EXPECT_EQ(p.fixture_multiplier, 1.0);
    EXPECT_EQ(p.ratio_multiplier, 1.0);
    EXPECT_EQ(p.starter_multiplier, params.starter.rotation_risk);
    EXPECT_DOUBLE_EQ(p.final_value, params.default_prior_baseline * params.starter.rotation_risk);
    EXPECT_DOUBLE_EQ(p.price_used, params.price_floor);

    for (const auto issue : {DataQualityIssue::MissingPriorBaseline,
                             DataQualityIssue::NoCurrentObservations,
                             DataQualityIssue::InsufficientFormHistory,
                             DataQualityIssue::MissingFixtureDifficulty,
                             DataQualityIssue::MissingShotRate,
                             DataQualityIssue::MissingStarterStatus,
                             DataQualityIssue::MissingPrice}) {
        EXPECT_TRUE(has(p, issue)) << to_string(issue);
    }
}

TEST(FormulaEngine, EmptyHistory_WellFormedPrediction) {
    const PlayerHistory h{.player_id = "ghost", .snapshots = {}};
    const Prediction p = FormulaEngine(ParameterSet::defaults()).evaluate(h, 5);
    EXPECT_TRUE(has(p, DataQualityIssue::EmptyHistory));
    EXPECT_TRUE(std::isfinite(p.final_value));
    EXPECT_TRUE(std::isfinite(p.value_per_price));
    EXPECT_GT(p.price_used, 0.0);
}

TEST(FormulaEngine, NonPositivePrice_UsesFloor) {
    PlayerHistory h = steady_history(4, 5.0);
    h.snapshots.back().price = 0.0;
    const Prediction p = FormulaEngine(ParameterSet::defaults()).evaluate(h, 4);
    EXPECT_DOUBLE_EQ(p.price_used, 0.1);
    EXPECT_TRUE(has(p, DataQualityIssue::NonPositivePrice));
    EXPECT_NEAR(p.value_per_price, p.final_value / 0.1, 1e-9);
}

TEST(FormulaEngine, TinyPositivePrice_FlooredWithoutEvent) {
    PlayerHistory h = steady_history(4, 5.0);
    h.snapshots.back().price = 0.05;
    const Prediction p = FormulaEngine(ParameterSet::defaults()).evaluate(h, 4);
    EXPECT_DOUBLE_EQ(p.price_used, 0.1);
    EXPECT_TRUE(p.data_quality.empty());
}

TEST(FormulaEngine, UnplayedCurrentPeriod_ContextStillApplies) {
    PlayerHistory h = steady_history(5, 6.0);
    h.snapshots.back().points.reset();
    h.snapshots.back().starter_override = StarterStatus::RuledOut;
    const Prediction p = FormulaEngine(ParameterSet::defaults()).evaluate(h, 5);
    EXPECT_EQ(p.starter_multiplier, 0.0);
    EXPECT_EQ(p.final_value, 0.0);
    EXPECT_FALSE(has(p, DataQualityIssue::NoCurrentObservations));
}

TEST(FormulaEngine, ToString_MentionsPlayerAndValue) {
    const Prediction p = FormulaEngine(ParameterSet::defaults()).evaluate(steady_history(3, 5.0), 3);
    const std::string s = p.to_string();
    EXPECT_NE(s.find("steady"), std::string::npos);
    EXPECT_NE(s.find("value="), std::string::npos);
}
