#pragma once

/// @file include/fvh/optimization.hpp
/// @brief Grid-search types: the parameter grid, its configuration, and the
///        run that accumulates one entry per evaluated ParameterSet.

#include "fvh/metrics.hpp"
#include "fvh/parameters.hpp"
#include "fvh/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fvh::validation {

/// Inclusive range of periods.
struct PeriodRange {
    Period first = 1;
    Period last  = 1;

    [[nodiscard]] bool contains(Period p) const noexcept { return p >= first && p <= last; }
    [[nodiscard]] bool valid() const noexcept { return first <= last; }

    bool operator==(const PeriodRange&) const = default;
};

/// Cartesian product of candidate values, applied over a base ParameterSet.
struct ParameterGrid {
    std::vector<double>           decay_rates;
    std::vector<int>              adaptation_horizons;
    std::vector<MultiplierBounds> form_caps;
    std::vector<MultiplierBounds> ratio_caps;

    /// Number of combinations (0 if any axis is empty).
    [[nodiscard]] std::size_t size() const noexcept;

    /// Combination `index` applied to `base`. Axes vary slowest first:
    /// decay rate, horizon, form cap, ratio cap. The name encodes the values.
    [[nodiscard]] ParameterSet combination(std::size_t index, const ParameterSet& base) const;

    /// alpha {0.75 .. 0.95}, K {12 .. 20}, three form caps, three ratio caps.
    [[nodiscard]] static ParameterGrid defaults();
};

struct OptimizationEntry;

/// Called after each grid entry is computed or reused: (entry, index, total,
/// reused).
using OptimizationProgress =
    std::function<void(const OptimizationEntry&, std::size_t, std::size_t, bool)>;

struct OptimizationConfig {
    std::size_t          sample_size       = 0;  ///< Players per test period, 0 = all
    std::uint64_t        seed              = 20240801;
    std::size_t          min_train_periods = 1;  ///< Earlier periods required before a period is tested
    MetricsConfig        metrics{};
    OptimizationProgress on_entry;
};

/// One evaluated ParameterSet over one period range, with the sampling and
/// metric settings it was computed under.
struct OptimizationEntry {
    ParameterSet      parameters;
    PeriodRange       range;
    std::size_t       sample_size       = 0;  ///< Players per test period, 0 = all
    std::size_t       min_train_periods = 1;
    std::uint64_t     seed              = 0;  ///< Seed used for player sampling, 0 when unsampled
    MetricsConfig     metrics_config{};
    ValidationMetrics metrics;
    std::size_t       succeeded = 0;  ///< Predictions paired with an outcome
    std::size_t       failed    = 0;  ///< Requested players with no usable history
    std::size_t       excluded  = 0;  ///< Predictions without a realized outcome

    /// Result-store key, see records::entry_key().
    [[nodiscard]] std::string key() const;

    bool operator==(const OptimizationEntry&) const = default;
};

struct OptimizationRun {
    std::vector<OptimizationEntry> entries;       ///< Grid order
    std::optional<std::size_t>     best_index;    ///< Lowest RMSE among sufficient entries
    std::size_t                    computed = 0;  ///< Entries evaluated in this run
    std::size_t                    reused   = 0;  ///< Entries found in the result store

    [[nodiscard]] std::optional<OptimizationEntry> best() const;

    /// Summary plus the best entry.
    [[nodiscard]] std::string to_string() const;
};

} // namespace fvh::validation
