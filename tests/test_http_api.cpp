#include <gtest/gtest.h>

#include <convsync/HttpApi.hpp>
#include <convsync/SqliteMessageStore.hpp>

#include "test_support.hpp"

using namespace convsync;
using convsync::test::FakeChannel;

namespace
{
    struct HttpApiFixture : ::testing::Test
    {
        std::shared_ptr<SqliteMessageStore> store = std::make_shared<SqliteMessageStore>(":memory:");
        GatewayMetrics metrics;
        SyncGateway gateway{store, &metrics};
        HttpApi api{store, &metrics, &gateway};

        HttpApi::Response call(http::verb method, const std::string &target, const std::string &body = {})
        {
            HttpApi::Request req{method, target, 11};
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
            return api.handle(req);
        }

        static nlohmann::json json_of(const HttpApi::Response &res)
        {
            return nlohmann::json::parse(res.body());
        }
    };
} // namespace

TEST_F(HttpApiFixture, HealthAndMetrics)
{
    auto health = call(http::verb::get, "/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(json_of(health)["status"], "ok");

    auto m = call(http::verb::get, "/metrics");
    EXPECT_EQ(m.result(), http::status::ok);
    EXPECT_NE(m.body().find("convsync_http_requests_total"), std::string::npos);
}

TEST_F(HttpApiFixture, PostMessagePersistsAndPublishes)
{
    auto ch = std::make_shared<FakeChannel>("s1");
    gateway.attach(ch);

    auto res = call(http::verb::post, "/api/messages/s1",
                    R"({"role":"assistant","content":"from agent","agent_name":"planner"})");

    ASSERT_EQ(res.result(), http::status::created);
    const std::string id = json_of(res)["message_id"].get<std::string>();
    EXPECT_TRUE(store->get_message("s1", id).has_value());

    ASSERT_EQ(ch->frames.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(ch->frames[0])["id"], id);
}

TEST_F(HttpApiFixture, PostMessageValidation)
{
    EXPECT_EQ(call(http::verb::post, "/api/messages/s1", "{oops").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/api/messages/s1", R"({"role":"robot","content":"x"})").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/api/messages/s1", R"({"role":"user"})").result(),
              http::status::bad_request);
    EXPECT_EQ(call(http::verb::post, "/api/messages/bad%20id", R"({"role":"user","content":"x"})").result(),
              http::status::bad_request);
}

TEST_F(HttpApiFixture, BatchReportsCountsAndFailures)
{
    auto res = call(http::verb::post, "/api/messages/s1/batch",
                    R"({"messages":[{"role":"user","content":"a"},{"role":"robot","content":"b"},{"content":"c"},{"role":"assistant","content":"d"}]})");

    ASSERT_EQ(res.result(), http::status::created);
    auto j = json_of(res);
    EXPECT_EQ(j["count"], 2);
    EXPECT_EQ(j["failed"], 2);
    EXPECT_EQ(j["message_ids"].size(), 2u);
    EXPECT_EQ(store->get_message_count("s1"), 2);
}

TEST_F(HttpApiFixture, BatchAcceptsBareArray)
{
    auto res = call(http::verb::post, "/api/messages/s1/batch", R"([{"role":"user","content":"a"}])");
    ASSERT_EQ(res.result(), http::status::created);
    EXPECT_EQ(json_of(res)["count"], 1);
}

TEST_F(HttpApiFixture, BatchWhereNothingSucceedsIsServerError)
{
    auto res = call(http::verb::post, "/api/messages/bad%20id/batch", R"([{"role":"user","content":"a"}])");
    EXPECT_EQ(res.result(), http::status::internal_server_error);

    EXPECT_EQ(call(http::verb::post, "/api/messages/s1/batch", R"({"messages":[]})").result(),
              http::status::bad_request);
}

TEST_F(HttpApiFixture, GetMessagesPaginates)
{
    for (int i = 0; i < 5; ++i)
        call(http::verb::post, "/api/messages/s1", R"({"role":"user","content":")" + std::to_string(i) + R"("})");

    auto res = call(http::verb::get, "/api/messages/s1?limit=2&offset=1");
    ASSERT_EQ(res.result(), http::status::ok);

    auto j = json_of(res);
    EXPECT_EQ(j["total_count"], 5);
    EXPECT_EQ(j["has_more"], true);
    ASSERT_EQ(j["messages"].size(), 2u);
    EXPECT_EQ(j["messages"][0]["content"], "1");

    auto tail = json_of(call(http::verb::get, "/api/messages/s1?limit=10&offset=3"));
    EXPECT_EQ(tail["has_more"], false);
    EXPECT_EQ(tail["messages"].size(), 2u);
}

TEST_F(HttpApiFixture, GetMessagesErrors)
{
    EXPECT_EQ(call(http::verb::get, "/api/messages/nobody").result(), http::status::not_found);

    call(http::verb::post, "/api/messages/s1", R"({"role":"user","content":"x"})");
    EXPECT_EQ(call(http::verb::get, "/api/messages/s1?offset=-1").result(), http::status::bad_request);
    EXPECT_EQ(call(http::verb::get, "/api/messages/s1?limit=abc").result(), http::status::bad_request);
}

TEST_F(HttpApiFixture, SessionLifecycle)
{
    auto created = call(http::verb::post, "/api/sessions/create",
                        R"({"session_id":"s-42","name":"Planning","user_id":"u1"})");
    ASSERT_EQ(created.result(), http::status::created);
    EXPECT_EQ(json_of(created)["name"], "Planning");

    auto listed = json_of(call(http::verb::get, "/api/sessions?user_id=u1"));
    ASSERT_EQ(listed["sessions"].size(), 1u);
    EXPECT_EQ(listed["sessions"][0]["session_id"], "s-42");

    auto renamed = call(http::verb::put, "/api/sessions/s-42/rename", R"({"name":"Retro"})");
    ASSERT_EQ(renamed.result(), http::status::ok);
    EXPECT_EQ(json_of(renamed)["name"], "Retro");

    auto fetched = call(http::verb::get, "/api/sessions/s-42");
    ASSERT_EQ(fetched.result(), http::status::ok);
    EXPECT_EQ(json_of(fetched)["session_id"], "s-42");
    EXPECT_EQ(json_of(fetched)["name"], "Retro");
    EXPECT_EQ(json_of(fetched)["user_id"], "u1");

    call(http::verb::post, "/api/messages/s-42", R"({"role":"user","content":"x"})");
    auto reset = call(http::verb::post, "/api/sessions/s-42/reset");
    ASSERT_EQ(reset.result(), http::status::ok);
    EXPECT_EQ(json_of(reset)["status"], "reset");
    EXPECT_EQ(store->get_message_count("s-42"), 0);

    auto deleted = call(http::verb::delete_, "/api/sessions/s-42");
    ASSERT_EQ(deleted.result(), http::status::ok);
    EXPECT_EQ(json_of(deleted)["status"], "deleted");
    EXPECT_TRUE(json_of(call(http::verb::get, "/api/sessions?user_id=u1"))["sessions"].empty());
    EXPECT_EQ(call(http::verb::get, "/api/sessions/s-42").result(), http::status::not_found);
}

TEST_F(HttpApiFixture, CreateSessionGeneratesId)
{
    auto res = call(http::verb::post, "/api/sessions/create", "");
    ASSERT_EQ(res.result(), http::status::created);

    const std::string sid = json_of(res)["session_id"].get<std::string>();
    EXPECT_EQ(sid.size(), 36u);
    EXPECT_EQ(json_of(res)["name"], "Session " + sid.substr(0, 8));
}

TEST_F(HttpApiFixture, MissingSessionsAreNotFound)
{
    EXPECT_EQ(call(http::verb::put, "/api/sessions/ghost/rename", R"({"name":"x"})").result(),
              http::status::not_found);
    EXPECT_EQ(call(http::verb::get, "/api/sessions/ghost").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::delete_, "/api/sessions/ghost").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::post, "/api/sessions/ghost/reset").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::put, "/api/sessions/ghost/rename", "{}").result(), http::status::bad_request);
}

TEST_F(HttpApiFixture, UnknownRoutesAndMethods)
{
    EXPECT_EQ(call(http::verb::get, "/nope").result(), http::status::not_found);
    EXPECT_EQ(call(http::verb::get, "/api/messages/s1/batch").result(), http::status::method_not_allowed);
    EXPECT_EQ(call(http::verb::post, "/health").result(), http::status::method_not_allowed);
}
