#include <gtest/gtest.h>
#include "fvh/snapshot_store.hpp"
#include "support/league.hpp"

#include <vector>

using namespace fvh;
using fvh::store::AppendResult;
using fvh::store::InMemorySnapshotStore;
using fvh::testing::full_snapshot;

TEST(SnapshotStore, Append_NewSnapshot) {
    InMemorySnapshotStore store;
    EXPECT_EQ(store.append(full_snapshot("kane", 1, 6.0)), AppendResult::Appended);
    EXPECT_EQ(store.size(), 1u);
}

TEST(SnapshotStore, Append_SameRevisionIsDuplicate) {
    InMemorySnapshotStore store;
    store.append(full_snapshot("kane", 1, 6.0));
    EXPECT_EQ(store.append(full_snapshot("kane", 1, 9.0)), AppendResult::Duplicate);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_DOUBLE_EQ(*store.realized_outcome("kane", 1), 6.0);
}

TEST(SnapshotStore, Revisions_LatestWinsOlderStayReadable) {
    InMemorySnapshotStore store;
    store.append(full_snapshot("kane", 1, 6.0));
    RawSnapshot corrected = full_snapshot("kane", 1, 8.0);
    corrected.revision = 2;
    EXPECT_EQ(store.append(corrected), AppendResult::Appended);

    RawSnapshot stale = full_snapshot("kane", 1, 7.0);
    stale.revision = 1;
    EXPECT_EQ(store.append(stale), AppendResult::StaleRevision);

    EXPECT_DOUBLE_EQ(*store.realized_outcome("kane", 1), 8.0);
    const auto revs = store.revisions("kane", 1);
    ASSERT_EQ(revs.size(), 2u);
    EXPECT_EQ(revs[0].revision, 0);
    EXPECT_EQ(revs[1].revision, 2);

    const auto history = store.player_history("kane", 1);
    ASSERT_EQ(history.snapshots.size(), 1u);
    EXPECT_EQ(history.snapshots[0].revision, 2);
}

TEST(SnapshotStore, PlayerHistory_NeverReturnsFuturePeriods) {
    InMemorySnapshotStore store;
    for (Period p = 1; p <= 6; ++p) store.append(full_snapshot("kane", p, 5.0 + p));

    const auto history = store.player_history("kane", 4);
    ASSERT_EQ(history.snapshots.size(), 4u);
    for (std::size_t i = 0; i < history.snapshots.size(); ++i) {
        EXPECT_EQ(history.snapshots[i].period, static_cast<Period>(i + 1));
    }
    EXPECT_EQ(history.player_id, "kane");
}

TEST(SnapshotStore, PlayerHistory_UnknownPlayerIsEmpty) {
    InMemorySnapshotStore store;
    store.append(full_snapshot("kane", 1, 6.0));
    EXPECT_TRUE(store.player_history("son", 5).empty());
    EXPECT_TRUE(store.player_history("kane", 0).empty());
}

TEST(SnapshotStore, RealizedOutcome_AbsentWhenUnplayed) {
    InMemorySnapshotStore store;
    store.append(full_snapshot("kane", 1, std::nullopt));
    EXPECT_FALSE(store.realized_outcome("kane", 1).has_value());
    EXPECT_FALSE(store.realized_outcome("kane", 2).has_value());
    EXPECT_FALSE(store.realized_outcome("son", 1).has_value());
}

TEST(SnapshotStore, PlayersAndPeriods_Sorted) {
    InMemorySnapshotStore store;
    store.append(full_snapshot("son", 3, 2.0));
    store.append(full_snapshot("kane", 1, 6.0));
    store.append(full_snapshot("kane", 3, 4.0));

    EXPECT_EQ(store.players_at(3), (std::vector<PlayerId>{"kane", "son"}));
    EXPECT_EQ(store.players_at(1), (std::vector<PlayerId>{"kane"}));
    EXPECT_TRUE(store.players_at(2).empty());
    EXPECT_EQ(store.periods(), (std::vector<Period>{1, 3}));
}

TEST(SnapshotStore, AppendAll_CountsAccepted) {
    InMemorySnapshotStore store;
    const std::vector<RawSnapshot> batch{
        full_snapshot("kane", 1, 6.0),
        full_snapshot("kane", 1, 6.0),
        full_snapshot("kane", 2, 3.0),
    };
    EXPECT_EQ(store.append_all(batch), 2u);
    EXPECT_EQ(store.size(), 2u);
}
