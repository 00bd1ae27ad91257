#include <gtest/gtest.h>

#include <cstdio>
#include <set>
#include <thread>

#include <sqlite3.h>

#include <convsync/SqliteMessageStore.hpp>
#include <convsync/errors.hpp>

using namespace convsync;

namespace
{
    NewMessage msg(std::string role, std::string content)
    {
        NewMessage m;
        m.role = std::move(role);
        m.content = std::move(content);
        return m;
    }

    struct MemoryStoreFixture : ::testing::Test
    {
        SqliteMessageStore store{":memory:"};
    };

    /// File-backed database, removed (with its WAL files) afterwards.
    struct FileStoreFixture : ::testing::Test
    {
        std::string path = ::testing::TempDir() + "convsync_store_test.db";

        void SetUp() override { remove_files(); }
        void TearDown() override { remove_files(); }

        void remove_files()
        {
            std::remove(path.c_str());
            std::remove((path + "-wal").c_str());
            std::remove((path + "-shm").c_str());
        }

        void exec_raw(const char *sql)
        {
            sqlite3 *db = nullptr;
            ASSERT_EQ(sqlite3_open(path.c_str(), &db), SQLITE_OK);
            char *err = nullptr;
            const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
            std::string message = err ? err : "";
            sqlite3_free(err);
            sqlite3_close(db);
            ASSERT_EQ(rc, SQLITE_OK) << message;
        }
    };
} // namespace

TEST_F(MemoryStoreFixture, AppendCreatesSessionWithDefaults)
{
    store.append_message("abcdef123456", msg("user", "hello"));

    auto s = store.get_session("abcdef123456");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->name, "Session abcdef12");
    EXPECT_TRUE(s->is_active);
    EXPECT_EQ(s->preview, std::optional<std::string>{"hello"});
    ASSERT_TRUE(s->last_message_at.has_value());
}

TEST_F(MemoryStoreFixture, AppendReturnsPersistedMessage)
{
    NewMessage m = msg("assistant", "hi there");
    m.agent_name = "planner";
    kvs_set_string(m.metadata, kClientIdKey, "tmp-1");

    const std::string id = store.append_message("s1", m);
    EXPECT_FALSE(id.empty());

    auto stored = store.get_message("s1", id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->role, Role::Assistant);
    EXPECT_EQ(stored->agent_name, std::optional<std::string>{"planner"});
    EXPECT_EQ(stored->client_id(), "tmp-1");
    EXPECT_GT(stored->timestamp, 0);

    EXPECT_FALSE(store.get_message("other", id).has_value());
}

TEST_F(MemoryStoreFixture, RejectsInvalidRoleAndSessionId)
{
    EXPECT_THROW(store.append_message("s1", msg("robot", "x")), ValidationError);
    EXPECT_THROW(store.append_message("bad id!", msg("user", "x")), ValidationError);
    EXPECT_THROW(store.append_message("", msg("user", "x")), ValidationError);
    EXPECT_EQ(store.get_message_count("s1"), 0);
}

TEST_F(MemoryStoreFixture, SystemMessagesDoNotTouchPreview)
{
    store.append_message("s1", msg("user", "first"));
    auto before = store.get_session("s1");

    store.append_message("s1", msg("system", "context switch"));
    auto after = store.get_session("s1");

    ASSERT_TRUE(before && after);
    EXPECT_EQ(after->preview, before->preview);
    EXPECT_EQ(after->last_message_at, before->last_message_at);
    EXPECT_EQ(store.get_message_count("s1"), 2);
}

TEST_F(MemoryStoreFixture, PreviewIsTruncatedToHundredCharacters)
{
    store.append_message("s1", msg("user", std::string(150, 'a')));

    auto s = store.get_session("s1");
    ASSERT_TRUE(s && s->preview);
    EXPECT_EQ(*s->preview, std::string(100, 'a') + "...");
}

TEST_F(MemoryStoreFixture, TimestampsNeverDecreaseAndOrderIsStable)
{
    std::vector<std::string> ids;
    for (int i = 0; i < 20; ++i)
        ids.push_back(store.append_message("s1", msg("user", "m" + std::to_string(i))));

    auto all = store.list_messages("s1");
    ASSERT_EQ(all.size(), 20u);
    for (std::size_t i = 0; i < all.size(); ++i)
    {
        EXPECT_EQ(all[i].id, ids[i]);
        if (i > 0)
            EXPECT_GE(all[i].timestamp, all[i - 1].timestamp);
    }
}

TEST_F(MemoryStoreFixture, ListMessagesPagesAndClampsLimit)
{
    for (int i = 0; i < 10; ++i)
        store.append_message("s1", msg("user", std::to_string(i)));

    auto page = store.list_messages("s1", 3, 4);
    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page[0].content, "4");
    EXPECT_EQ(page[2].content, "6");

    EXPECT_EQ(store.list_messages("s1", 100000).size(), 10u);
    EXPECT_TRUE(store.list_messages("s1", 0).empty());
}

TEST_F(MemoryStoreFixture, RecentMessagesAreTheTailInAscendingOrder)
{
    for (int i = 0; i < 10; ++i)
        store.append_message("s1", msg("user", std::to_string(i)));

    auto tail = store.list_recent_messages("s1", 3);
    ASSERT_EQ(tail.size(), 3u);
    EXPECT_EQ(tail[0].content, "7");
    EXPECT_EQ(tail[2].content, "9");
}

TEST_F(MemoryStoreFixture, MessagesAfterAnchor)
{
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i)
        ids.push_back(store.append_message("s1", msg("user", std::to_string(i))));

    auto after = store.list_messages_after("s1", ids[2]);
    ASSERT_TRUE(after.has_value());
    ASSERT_EQ(after->size(), 2u);
    EXPECT_EQ((*after)[0].id, ids[3]);

    auto none = store.list_messages_after("s1", ids[4]);
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none->empty());

    EXPECT_FALSE(store.list_messages_after("s1", "unknown").has_value());
    EXPECT_FALSE(store.list_messages_after("s2", ids[0]).has_value());
}

TEST_F(MemoryStoreFixture, CreateOrUpdateOverwritesOnlyGivenFields)
{
    store.create_or_update_session("s1", std::string{"Planning"}, std::string{"u1"});
    store.create_or_update_session("s1", std::nullopt, std::string{"u2"});

    auto s = store.get_session("s1");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->name, "Planning");
    EXPECT_EQ(s->user_id, std::optional<std::string>{"u2"});
}

TEST_F(MemoryStoreFixture, ListSessionsFiltersAndOrdersByActivity)
{
    store.create_or_update_session("a", std::nullopt, std::string{"u1"});
    store.create_or_update_session("b", std::nullopt, std::string{"u1"});
    store.create_or_update_session("c", std::nullopt, std::string{"u2"});

    std::this_thread::sleep_for(std::chrono::milliseconds{5});
    store.append_message("a", msg("user", "latest"));

    auto u1 = store.list_sessions(std::string{"u1"});
    ASSERT_EQ(u1.size(), 2u);
    EXPECT_EQ(u1[0].session_id, "a");

    EXPECT_EQ(store.list_sessions().size(), 3u);
    EXPECT_EQ(store.list_sessions(std::nullopt, 1).size(), 1u);
}

TEST_F(MemoryStoreFixture, SoftDeleteHidesSessionButKeepsRows)
{
    store.append_message("s1", msg("user", "x"));

    EXPECT_TRUE(store.soft_delete_session("s1"));
    EXPECT_FALSE(store.soft_delete_session("missing"));

    EXPECT_TRUE(store.list_sessions().empty());
    auto s = store.get_session("s1");
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->is_active);
    EXPECT_EQ(store.get_message_count("s1"), 1);

    store.create_or_update_session("s1");
    EXPECT_TRUE(store.get_session("s1")->is_active);
}

TEST_F(MemoryStoreFixture, ResetPurgesMessagesAndPreview)
{
    store.append_message("s1", msg("user", "x"));
    store.append_message("s1", msg("assistant", "y"));

    EXPECT_TRUE(store.reset_session_messages("s1"));
    EXPECT_EQ(store.get_message_count("s1"), 0);

    auto s = store.get_session("s1");
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->preview.has_value());
    EXPECT_FALSE(s->last_message_at.has_value());

    EXPECT_FALSE(store.reset_session_messages("missing"));
}

TEST_F(MemoryStoreFixture, BatchCountsFailuresAndKeepsOrder)
{
    auto r = store.append_messages("s1", {msg("user", "a"), msg("robot", "b"), msg("assistant", "c")});

    EXPECT_EQ(r.ids.size(), 2u);
    EXPECT_EQ(r.failed, 1u);

    auto all = store.list_messages("s1");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].content, "a");
    EXPECT_EQ(all[1].content, "c");
}

TEST_F(MemoryStoreFixture, BatchThrowsWhenNothingSucceeds)
{
    EXPECT_THROW(store.append_messages("s1", {msg("robot", "a")}), ValidationError);
    EXPECT_THROW(store.append_messages("s1", {}), ValidationError);
}

TEST_F(FileStoreFixture, FailedMetadataUpdateRollsBackTheMessage)
{
    SqliteMessageStore store{path, 2};
    store.append_message("s1", msg("user", "kept"));

    exec_raw("CREATE TRIGGER fail_session_update BEFORE UPDATE ON sessions "
             "BEGIN SELECT RAISE(ABORT, 'injected'); END;");

    EXPECT_THROW(store.append_message("s1", msg("user", "lost")), StorageUnavailable);

    EXPECT_EQ(store.get_message_count("s1"), 1);
    EXPECT_EQ(store.get_session("s1")->preview, std::optional<std::string>{"kept"});

    // System messages skip the metadata update and still persist.
    EXPECT_NO_THROW(store.append_message("s1", msg("system", "note")));
    EXPECT_EQ(store.get_message_count("s1"), 2);
}

TEST_F(FileStoreFixture, MetadataUpdateTouchingNoRowRollsBack)
{
    SqliteMessageStore store{path, 2};
    store.append_message("s1", msg("user", "kept"));

    exec_raw("CREATE TRIGGER skip_session_update BEFORE UPDATE ON sessions "
             "BEGIN SELECT RAISE(IGNORE); END;");

    EXPECT_THROW(store.append_message("s1", msg("assistant", "lost")), StorageUnavailable);
    EXPECT_EQ(store.get_message_count("s1"), 1);
}

TEST_F(FileStoreFixture, DataSurvivesReopen)
{
    std::string id;
    {
        SqliteMessageStore store{path};
        id = store.append_message("s1", msg("user", "durable"));
    }

    SqliteMessageStore store{path};
    auto m = store.get_message("s1", id);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->content, "durable");
}

TEST_F(FileStoreFixture, ConcurrentAppendsAcrossSessions)
{
    SqliteMessageStore store{path, 4};

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&store, t]()
                             {
                                 const std::string sid = "s" + std::to_string(t % 2);
                                 for (int i = 0; i < kPerThread; ++i)
                                     store.append_message(sid, msg("user", std::to_string(i))); });
    }
    for (auto &th : threads)
        th.join();

    EXPECT_EQ(store.get_message_count("s0") + store.get_message_count("s1"), kThreads * kPerThread);

    auto all = store.list_messages("s0", 500);
    std::set<std::string> unique;
    for (std::size_t i = 0; i < all.size(); ++i)
    {
        unique.insert(all[i].id);
        if (i > 0)
            EXPECT_GE(all[i].timestamp, all[i - 1].timestamp);
    }
    EXPECT_EQ(unique.size(), all.size());
}
