#include <gtest/gtest.h>

#include <convsync/SqliteMessageStore.hpp>
#include <convsync/SyncGateway.hpp>
#include <convsync/channel.hpp>
#include <convsync/errors.hpp>

#include "test_support.hpp"

using namespace convsync;
using convsync::test::FakeChannel;

namespace
{
    /// Store whose appends always hit a backend failure.
    class UnavailableStore : public SqliteMessageStore
    {
    public:
        UnavailableStore() : SqliteMessageStore(":memory:") {}

        std::string append_message(const std::string &, const NewMessage &) override
        {
            throw StorageUnavailable("disk on fire");
        }
    };

    nlohmann::json parse(const std::string &frame)
    {
        return nlohmann::json::parse(frame);
    }

    struct GatewayFixture : ::testing::Test
    {
        std::shared_ptr<SqliteMessageStore> store = std::make_shared<SqliteMessageStore>(":memory:");
        GatewayMetrics metrics;
        SyncGateway gateway{store, &metrics};

        std::shared_ptr<FakeChannel> open(const std::string &sid)
        {
            auto ch = std::make_shared<FakeChannel>(sid);
            gateway.attach(ch);
            return ch;
        }

        std::string append(const std::string &sid, const std::string &content)
        {
            NewMessage m;
            m.role = "user";
            m.content = content;
            return store->append_message(sid, m);
        }
    };
} // namespace

TEST(SessionTarget, ExtractsValidSessionIds)
{
    EXPECT_EQ(session_id_from_target("/ws/s1"), std::optional<std::string>{"s1"});
    EXPECT_EQ(session_id_from_target("/ws/s1/"), std::optional<std::string>{"s1"});
    EXPECT_EQ(session_id_from_target("/ws/abc-123?token=x"), std::optional<std::string>{"abc-123"});
    EXPECT_EQ(session_id_from_target("/ws/1f0c2a9b-7e4d-4c1a-9f00-1234567890ab"),
              std::optional<std::string>{"1f0c2a9b-7e4d-4c1a-9f00-1234567890ab"});
}

TEST(SessionTarget, RejectsMalformedTargets)
{
    EXPECT_FALSE(session_id_from_target("/").has_value());
    EXPECT_FALSE(session_id_from_target("/ws/").has_value());
    EXPECT_FALSE(session_id_from_target("/chat/s1").has_value());
    EXPECT_FALSE(session_id_from_target("/ws/a b").has_value());
    EXPECT_FALSE(session_id_from_target("/ws/a/b").has_value());
    EXPECT_FALSE(session_id_from_target("/ws/" + std::string(129, 'x')).has_value());
}

TEST(SyncGatewayCtor, RequiresAStore)
{
    EXPECT_THROW(SyncGateway{nullptr}, std::invalid_argument);
}

TEST_F(GatewayFixture, MessageIsConfirmedAndBroadcastToSameSessionOnly)
{
    auto a = open("s1");
    auto b = open("s1");
    auto other = open("s2");

    gateway.handle_text(*a, R"({"type":"message","role":"user","content":"hi","metadata":{"client_id":"tmp-1"}})");

    ASSERT_EQ(a->frames.size(), 1u);
    ASSERT_EQ(b->frames.size(), 1u);
    EXPECT_TRUE(other->frames.empty());
    EXPECT_EQ(a->frames[0], b->frames[0]);

    auto j = parse(a->frames[0]);
    EXPECT_EQ(j["type"], "message");
    EXPECT_EQ(j["session_id"], "s1");
    EXPECT_EQ(j["role"], "user");
    EXPECT_EQ(j["content"], "hi");
    EXPECT_EQ(j["metadata"]["client_id"], "tmp-1");
    EXPECT_TRUE(j["timestamp"].is_number_integer());

    auto stored = store->get_message("s1", j["id"].get<std::string>());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->timestamp, j["timestamp"].get<std::int64_t>());
    EXPECT_EQ(metrics.messages_persisted_total.load(), 1u);
}

TEST_F(GatewayFixture, InvalidRoleGetsNoConfirmation)
{
    auto a = open("s1");
    gateway.handle_text(*a, R"({"type":"message","role":"robot","content":"hi"})");

    EXPECT_TRUE(a->frames.empty());
    EXPECT_EQ(store->get_message_count("s1"), 0);
}

TEST_F(GatewayFixture, NonStringContentIsDropped)
{
    auto a = open("s1");
    gateway.handle_text(*a, R"({"type":"message","role":"user","content":42})");

    EXPECT_TRUE(a->frames.empty());
    EXPECT_EQ(metrics.frames_malformed_total.load(), 1u);
}

TEST_F(GatewayFixture, MalformedAndUnknownFramesKeepChannelUsable)
{
    auto a = open("s1");

    gateway.handle_text(*a, "not json");
    gateway.handle_text(*a, R"([1,2,3])");
    gateway.handle_text(*a, R"({"no_type":true})");
    gateway.handle_text(*a, R"({"type":"teleport"})");
    EXPECT_TRUE(a->frames.empty());
    EXPECT_EQ(metrics.frames_malformed_total.load(), 4u);

    gateway.handle_text(*a, R"({"type":"heartbeat"})");
    ASSERT_EQ(a->frames.size(), 1u);
    EXPECT_EQ(parse(a->frames[0])["type"], "heartbeat");
}

TEST_F(GatewayFixture, HistoryReturnsMostRecentAscending)
{
    for (int i = 0; i < 60; ++i)
        append("s1", std::to_string(i));

    auto a = open("s1");
    gateway.handle_text(*a, R"({"type":"history_request","limit":5})");

    ASSERT_EQ(a->frames.size(), 1u);
    auto j = parse(a->frames[0]);
    EXPECT_EQ(j["type"], "history");
    ASSERT_EQ(j["messages"].size(), 5u);
    EXPECT_EQ(j["messages"][0]["content"], "55");
    EXPECT_EQ(j["messages"][4]["content"], "59");
}

TEST_F(GatewayFixture, HistoryLimitDefaultsToFifty)
{
    for (int i = 0; i < 60; ++i)
        append("s1", std::to_string(i));

    auto a = open("s1");
    gateway.handle_text(*a, R"({"type":"history_request"})");
    gateway.handle_text(*a, R"({"type":"history_request","limit":-3})");

    ASSERT_EQ(a->frames.size(), 2u);
    EXPECT_EQ(parse(a->frames[0])["messages"].size(), 50u);
    EXPECT_EQ(parse(a->frames[1])["messages"].size(), 50u);
}

TEST_F(GatewayFixture, SyncReturnsMessagesStrictlyAfterAnchor)
{
    append("s1", "a");
    const std::string anchor = append("s1", "b");
    append("s1", "c");
    append("s1", "d");

    auto ch = open("s1");
    gateway.handle_text(*ch, R"({"type":"sync_request","last_message_id":")" + anchor + R"(","timestamp":0})");

    ASSERT_EQ(ch->frames.size(), 1u);
    auto j = parse(ch->frames[0]);
    EXPECT_EQ(j["type"], "sync_response");
    ASSERT_EQ(j["messages"].size(), 2u);
    EXPECT_EQ(j["messages"][0]["content"], "c");
    EXPECT_EQ(j["messages"][1]["content"], "d");
}

TEST_F(GatewayFixture, SyncWithUnknownAnchorFallsBackToHistory)
{
    for (int i = 0; i < 55; ++i)
        append("s1", std::to_string(i));

    auto ch = open("s1");
    gateway.handle_text(*ch, R"({"type":"sync_request","last_message_id":"nope","timestamp":0})");

    ASSERT_EQ(ch->frames.size(), 1u);
    auto j = parse(ch->frames[0]);
    EXPECT_EQ(j["type"], "sync_response");
    ASSERT_EQ(j["messages"].size(), 50u);
    EXPECT_EQ(j["messages"][0]["content"], "5");
}

TEST_F(GatewayFixture, ExpiredAndDetachedChannelsAreSkipped)
{
    auto a = open("s1");
    {
        auto gone = open("s1");
        EXPECT_EQ(gateway.channel_count("s1"), 2u);
    }
    EXPECT_EQ(gateway.channel_count("s1"), 1u);

    auto b = open("s1");
    gateway.detach(*b);
    EXPECT_EQ(gateway.channel_count("s1"), 1u);

    gateway.handle_text(*a, R"({"type":"message","role":"user","content":"x"})");
    EXPECT_EQ(a->frames.size(), 1u);
    EXPECT_TRUE(b->frames.empty());
}

TEST_F(GatewayFixture, PublishReachesEveryChannelOfTheSession)
{
    auto a = open("s1");
    auto b = open("s1");

    const std::string id = append("s1", "from http");
    gateway.publish(*store->get_message("s1", id));

    EXPECT_EQ(a->frames.size(), 1u);
    EXPECT_EQ(b->frames.size(), 1u);
}

TEST(SyncGatewayFailures, StorageFailureGetsNoConfirmation)
{
    auto store = std::make_shared<UnavailableStore>();
    GatewayMetrics metrics;
    SyncGateway gateway{store, &metrics};

    auto ch = std::make_shared<FakeChannel>("s1");
    gateway.attach(ch);
    gateway.handle_text(*ch, R"({"type":"message","role":"user","content":"x"})");

    EXPECT_TRUE(ch->frames.empty());
    EXPECT_EQ(metrics.errors_total.load(), 1u);
}
