#pragma once

#include <cstddef>

/// @file include/fvh/constants.hpp
/// @brief Formula and validation constants for the Fantasy Value Hunter core.
///
/// Defaults that a ParameterSet does not carry, plus the documented default
/// values ParameterSet::defaults() is built from.

namespace fvh::constants {

// ─── Multipliers ──────────────────────────────────────────────────────────────

/// Every multiplier degrades to this value when its input signal is missing.
static constexpr double NEUTRAL_MULTIPLIER = 1.0;

/// Form needs at least this many realized observations before it departs
/// from neutral.
static constexpr std::size_t MIN_FORM_OBSERVATIONS = 2;

// ─── ParameterSet Defaults ────────────────────────────────────────────────────

static constexpr double      DEFAULT_DECAY_RATE          = 0.87;
static constexpr std::size_t DEFAULT_LOOKBACK            = 8;
static constexpr int         DEFAULT_ADAPTATION_HORIZON  = 16;
static constexpr double      DEFAULT_GLOBAL_CAP          = 3.0;
static constexpr double      DEFAULT_FIXTURE_BASE        = 1.05;
static constexpr double      DEFAULT_RATIO_DAMPENING     = 0.3;
static constexpr double      DEFAULT_RATIO_MIN_BASELINE  = 0.05;
static constexpr double      DEFAULT_ROTATION_PENALTY    = 0.85;
static constexpr double      DEFAULT_BENCH_PENALTY       = 0.10;

/// Blended baselines never drop below this, so form never divides by zero.
static constexpr double DEFAULT_BASELINE_FLOOR = 0.1;

/// Substituted for a missing or non-positive price.
static constexpr double DEFAULT_PRICE_FLOOR = 0.1;

/// Prior-season points per period assumed when a player has none on record.
static constexpr double DEFAULT_PRIOR_BASELINE = 6.0;

// ─── Validation ───────────────────────────────────────────────────────────────

/// Below this many (prediction, outcome) pairs metrics are reported as
/// insufficient.
static constexpr std::size_t MIN_METRICS_SAMPLE = 3;

/// Default K for precision@K.
static constexpr std::size_t DEFAULT_TOP_K = 20;

/// Fixture difficulty below this is an "easy" stratum, above the hard
/// threshold a "hard" one.
static constexpr double EASY_FIXTURE_THRESHOLD = -3.0;
static constexpr double HARD_FIXTURE_THRESHOLD = 3.0;

/// Price tier boundaries: budget < MID, mid < PREMIUM, premium otherwise.
static constexpr double MID_PRICE_THRESHOLD     = 7.0;
static constexpr double PREMIUM_PRICE_THRESHOLD = 10.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace fvh::constants
