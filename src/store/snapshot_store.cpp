/// @file src/store/snapshot_store.cpp
/// @brief Append-only in-memory RawSnapshotStore.

#include "fvh/snapshot_store.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace fvh::store {

// ─── Writes ───────────────────────────────────────────────────────────────────

AppendResult InMemorySnapshotStore::append(RawSnapshot snapshot) {
    auto& revisions = data_[snapshot.player_id][snapshot.period];
    if (!revisions.empty()) {
        const int newest = revisions.back().revision;
        if (std::any_of(revisions.begin(), revisions.end(),
                        [&](const RawSnapshot& r) { return r.revision == snapshot.revision; })) {
            return AppendResult::Duplicate;
        }
        if (snapshot.revision < newest) {
            return AppendResult::StaleRevision;
        }
    }
    revisions.push_back(std::move(snapshot));
    ++size_;
    return AppendResult::Appended;
}

std::size_t InMemorySnapshotStore::append_all(std::span<const RawSnapshot> snapshots) {
    std::size_t appended = 0;
    for (const auto& s : snapshots) {
        if (append(s) == AppendResult::Appended) ++appended;
    }
    return appended;
}

// ─── Reads ────────────────────────────────────────────────────────────────────

std::vector<RawSnapshot> InMemorySnapshotStore::revisions(const PlayerId& player,
                                                          Period period) const {
    const auto p = data_.find(player);
    if (p == data_.end()) return {};
    const auto r = p->second.find(period);
    if (r == p->second.end()) return {};
    return r->second;
}

PlayerHistory InMemorySnapshotStore::player_history(const PlayerId& player, Period as_of) const {
    PlayerHistory history{.player_id = player, .snapshots = {}};
    const auto p = data_.find(player);
    if (p == data_.end()) return history;

    for (const auto& [period, revs] : p->second) {
        if (period > as_of) break;
        history.snapshots.push_back(revs.back());
    }
    return history;
}

std::optional<double> InMemorySnapshotStore::realized_outcome(const PlayerId& player,
                                                              Period period) const {
    const auto p = data_.find(player);
    if (p == data_.end()) return std::nullopt;
    const auto r = p->second.find(period);
    if (r == p->second.end()) return std::nullopt;
    return r->second.back().points;
}

std::vector<PlayerId> InMemorySnapshotStore::players_at(Period period) const {
    std::vector<PlayerId> players;
    for (const auto& [id, periods] : data_) {
        if (periods.count(period) != 0) players.push_back(id);
    }
    return players;
}

std::vector<Period> InMemorySnapshotStore::periods() const {
    std::set<Period> all;
    for (const auto& [id, periods] : data_) {
        for (const auto& [period, revs] : periods) all.insert(period);
    }
    return {all.begin(), all.end()};
}

} // namespace fvh::store
