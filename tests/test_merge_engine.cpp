#include <gtest/gtest.h>

#include <convsync/MergeEngine.hpp>

#include "test_support.hpp"

using namespace convsync;
using convsync::test::cached;

namespace
{
    std::vector<std::string> ids(const std::vector<CachedMessage> &v)
    {
        std::vector<std::string> out;
        for (const auto &m : v)
            out.push_back(m.id);
        return out;
    }
} // namespace

TEST(MergeEngine, EmptyInputsGiveEmptyOutput)
{
    EXPECT_TRUE(merge({}, {}).empty());
}

TEST(MergeEngine, RemoteOverwritesLocalWithSameId)
{
    auto local = cached("a", 10, SyncState::Confirmed, "old");
    auto remote = cached("a", 10, SyncState::Confirmed, "new");

    auto out = merge({local}, {remote});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].content, "new");
}

TEST(MergeEngine, KeepsLocalOnlyEntriesAndSortsByTimestamp)
{
    auto out = merge({cached("b", 20), cached("a", 10)}, {cached("c", 15)});
    EXPECT_EQ(ids(out), (std::vector<std::string>{"a", "c", "b"}));
}

TEST(MergeEngine, LocalEntriesWithoutIdAreAlwaysKept)
{
    auto out = merge({cached("", 1), cached("", 2)}, {});
    EXPECT_EQ(out.size(), 2u);
}

TEST(MergeEngine, RemoteEntriesWithoutIdAreSkipped)
{
    auto out = merge({cached("1", 100)}, {cached("2", 200), cached("", 300)});
    EXPECT_EQ(ids(out), (std::vector<std::string>{"1", "2"}));
}

TEST(MergeEngine, MergingTheSameResponseTwiceChangesNothing)
{
    auto pending = cached("tmp-1", 150, SyncState::Pending, "draft");
    std::vector<CachedMessage> local{cached("1", 100), pending, cached("", 120)};

    auto confirmed = cached("srv-2", 160, SyncState::Confirmed, "draft");
    kvs_set_string(confirmed.metadata, kClientIdKey, "tmp-1");
    std::vector<CachedMessage> remote{cached("1", 100, SyncState::Confirmed, "edited"),
                                      confirmed,
                                      cached("3", 300),
                                      cached("", 310)};

    auto once = merge(local, remote);
    auto twice = merge(once, remote);

    ASSERT_EQ(twice.size(), once.size());
    for (std::size_t i = 0; i < once.size(); ++i)
    {
        EXPECT_EQ(twice[i].id, once[i].id);
        EXPECT_EQ(twice[i].content, once[i].content);
        EXPECT_EQ(twice[i].timestamp, once[i].timestamp);
        EXPECT_EQ(twice[i].sync_state, once[i].sync_state);
    }
    EXPECT_EQ(ids(once), (std::vector<std::string>{"1", "", "srv-2", "3"}));
}

TEST(MergeEngine, DuplicateIdsCollapseToOneEntry)
{
    auto out = merge({cached("a", 10, SyncState::Confirmed, "first"),
                      cached("b", 20),
                      cached("a", 10, SyncState::Confirmed, "second")},
                     {cached("b", 20, SyncState::Confirmed, "remote-b"),
                      cached("b", 20, SyncState::Confirmed, "remote-b2")});

    EXPECT_EQ(ids(out), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(out[0].content, "second");
    EXPECT_EQ(out[1].content, "remote-b2");
}

TEST(MergeEngine, DropsPendingEntryConfirmedUnderServerId)
{
    auto pending = cached("tmp-1", 100, SyncState::Pending, "hello");
    kvs_set_string(pending.metadata, kClientIdKey, "tmp-1");

    auto confirmed = cached("srv-1", 105, SyncState::Confirmed, "hello");
    kvs_set_string(confirmed.metadata, kClientIdKey, "tmp-1");

    auto out = merge({pending}, {confirmed});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, "srv-1");
    EXPECT_EQ(out[0].sync_state, SyncState::Confirmed);
}

TEST(MergeEngine, UnconfirmedPendingEntrySurvives)
{
    auto pending = cached("tmp-2", 200, SyncState::Pending);
    auto out = merge({pending}, {cached("srv-1", 100)});

    EXPECT_EQ(ids(out), (std::vector<std::string>{"srv-1", "tmp-2"}));
    EXPECT_EQ(out[1].sync_state, SyncState::Pending);
}

TEST(MergeEngine, EqualTimestampsKeepInsertionOrder)
{
    auto out = merge({cached("x", 5), cached("y", 5)}, {cached("z", 5)});
    EXPECT_EQ(ids(out), (std::vector<std::string>{"x", "y", "z"}));
}

TEST(MergeEngine, OverwriteKeepsOriginalPositionBeforeSort)
{
    // Same timestamp everywhere: the overwritten entry stays first.
    auto out = merge({cached("a", 1), cached("b", 1)}, {cached("c", 1), cached("a", 1, SyncState::Confirmed, "v2")});

    EXPECT_EQ(ids(out), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(out[0].content, "v2");
}
