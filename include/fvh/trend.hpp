#pragma once

/// @file include/fvh/trend.hpp
/// @brief Retrospective recomputation of the formula over period ranges.
///
/// # Module: Trend Analysis
///
/// ## Responsibility
/// For every period in a range and every requested player, fetch the as-of
/// history from the snapshot store and evaluate the FormulaEngine. Several
/// ParameterSets can be run side by side over the same raw data; a single
/// player's trajectory can be extracted as a series.
///
/// ## Guarantees
/// - Reads only from the RawSnapshotStore; writes nothing
/// - Periods are processed in ascending order, players in id order
/// - Output is identical for any worker count
/// - InvalidParameterSet and LookaheadViolation abort the whole run
///
/// ## NOT Responsible For
/// - Scoring the predictions against outcomes (see validation.hpp)

#include "fvh/parameters.hpp"
#include "fvh/snapshot_store.hpp"
#include "fvh/types.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace fvh::trend {

struct TrendConfig {
    std::size_t workers = 1;  ///< Concurrent per-player tasks; 1 = sequential
};

/// Predictions of one ParameterSet over one period range.
struct TrendRun {
    std::string             parameter_set;  ///< ParameterSet::identity()
    Period                  first = 0;
    Period                  last  = 0;
    std::vector<Prediction> predictions;    ///< (period, player) ascending
    std::size_t             succeeded = 0;
    std::size_t             failed    = 0;  ///< Requested players with no snapshot visible
    std::size_t             degraded  = 0;  ///< Predictions carrying data-quality events

    /// Counts plus a breakdown of data-quality events by kind.
    [[nodiscard]] std::string to_string() const;
};

class TrendAnalysisEngine {
public:
    /// The store must outlive the engine.
    explicit TrendAnalysisEngine(const store::RawSnapshotStore& store, TrendConfig config = {});

    /// Evaluate `params` for every period in [first, last]. With `players`
    /// empty, each period covers the players that have a snapshot in it.
    ///
    /// @throws InvalidParameterSet, LookaheadViolation
    [[nodiscard]] TrendRun calculate(const ParameterSet& params,
                                     Period first,
                                     Period last,
                                     std::span<const PlayerId> players = {}) const;

    /// One TrendRun per set, in the order given, over identical inputs.
    [[nodiscard]] std::vector<TrendRun>
    compare_parameter_sets(std::span<const ParameterSet> sets,
                           Period first,
                           Period last,
                           std::span<const PlayerId> players = {}) const;

    /// One player's predictions over [first, last]; periods in which the
    /// player has no snapshot are left out.
    [[nodiscard]] std::vector<Prediction> player_trend(const PlayerId& player,
                                                       const ParameterSet& params,
                                                       Period first,
                                                       Period last) const;

private:
    const store::RawSnapshotStore& store_;
    TrendConfig                    config_;
};

} // namespace fvh::trend
