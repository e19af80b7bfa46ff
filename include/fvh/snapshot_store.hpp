#pragma once

/// @file include/fvh/snapshot_store.hpp
/// @brief Read contract over immutable raw snapshots, plus an in-memory store.
///
/// # Module: Snapshot Store
///
/// ## Responsibility
/// Answer "history of player X up to period N" and "what did player X
/// actually score in period N" for the recomputation and validation engines.
///
/// ## Guarantees
/// - player_history(p, n) never returns a snapshot with period > n
/// - Snapshots are append-only; a (player, period, revision) is stored once
/// - Queries see the highest revision of each period; older revisions stay
///   readable through revisions()
/// - const member functions are safe to call concurrently as long as no
///   append is running
///
/// ## NOT Responsible For
/// - Persistence technology (any backend implements RawSnapshotStore)
/// - Importing external feeds (see data_loader.hpp)

#include "fvh/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace fvh::store {

// ─── Contract ─────────────────────────────────────────────────────────────────

class RawSnapshotStore {
public:
    virtual ~RawSnapshotStore() = default;

    /// Latest revision per period, period ascending, all periods <= as_of.
    [[nodiscard]] virtual PlayerHistory player_history(const PlayerId& player,
                                                       Period as_of) const = 0;

    /// Realized points for `player` in `period`; nullopt if not played or
    /// not on record.
    [[nodiscard]] virtual std::optional<double> realized_outcome(const PlayerId& player,
                                                                 Period period) const = 0;

    /// Players with a snapshot in `period`, sorted by id.
    [[nodiscard]] virtual std::vector<PlayerId> players_at(Period period) const = 0;

    /// Every period with at least one snapshot, ascending.
    [[nodiscard]] virtual std::vector<Period> periods() const = 0;
};

// ─── In-memory implementation ─────────────────────────────────────────────────

enum class AppendResult {
    Appended,
    Duplicate,       ///< Same (player, period, revision) already stored
    StaleRevision,   ///< Lower than the newest stored revision for that period
};

class InMemorySnapshotStore final : public RawSnapshotStore {
public:
    InMemorySnapshotStore() = default;

    AppendResult append(RawSnapshot snapshot);

    /// Append each snapshot; returns how many were accepted.
    std::size_t append_all(std::span<const RawSnapshot> snapshots);

    /// Every stored revision of (player, period), revision ascending.
    [[nodiscard]] std::vector<RawSnapshot> revisions(const PlayerId& player,
                                                     Period period) const;

    /// Total stored snapshots, all revisions counted.
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] PlayerHistory player_history(const PlayerId& player,
                                               Period as_of) const override;
    [[nodiscard]] std::optional<double> realized_outcome(const PlayerId& player,
                                                         Period period) const override;
    [[nodiscard]] std::vector<PlayerId> players_at(Period period) const override;
    [[nodiscard]] std::vector<Period>   periods() const override;

private:
    // player -> period -> revisions, ascending
    std::map<PlayerId, std::map<Period, std::vector<RawSnapshot>>> data_;
    std::size_t size_ = 0;
};

} // namespace fvh::store
