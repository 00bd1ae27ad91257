#ifndef CONVSYNC_HTTP_API_HPP
#define CONVSYNC_HTTP_API_HPP

/**
 * @file HttpApi.hpp
 * @brief REST surface of the gateway over Boost.Beast HTTP.
 *
 * Routes:
 *
 *   POST   /api/messages/{sid}          { role, content, agent_name?, user_id?, metadata? }
 *                                       -> 201 { message_id }
 *   POST   /api/messages/{sid}/batch    { messages: [...] } (or a bare array)
 *                                       -> 201 { message_ids, count, failed }
 *   GET    /api/messages/{sid}?limit&offset
 *                                       -> { messages, total_count, has_more }
 *   GET    /api/sessions?user_id&limit&offset
 *                                       -> { sessions }
 *   POST   /api/sessions/create         { session_id?, name?, user_id? } -> 201 session
 *   PUT    /api/sessions/{sid}/rename   { name } -> session
 *   GET    /api/sessions/{sid}          -> session (404 once deleted)
 *   DELETE /api/sessions/{sid}          -> { status: "deleted" }
 *   POST   /api/sessions/{sid}/reset    -> { status: "reset" }
 *   GET    /metrics                     -> Prometheus text
 *   GET    /health                      -> { status: "ok" }
 *
 * Errors are JSON `{ "error": "..." }` with 400 (validation, bad JSON),
 * 404 (unknown session / route), 503 (storage unavailable) or 500.
 *
 * Messages appended through the API are also published to the session's
 * open WebSocket channels when a SyncGateway is attached.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <convsync/Metrics.hpp>
#include <convsync/MessageStore.hpp>
#include <convsync/SyncGateway.hpp>

namespace convsync
{
    namespace http = boost::beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    [[nodiscard]] nlohmann::json session_to_json(const Session &s);

    class HttpApi
    {
    public:
        using Request = http::request<http::string_body>;
        using Response = http::response<http::string_body>;

        explicit HttpApi(std::shared_ptr<IMessageStore> store,
                         GatewayMetrics *metrics = nullptr,
                         SyncGateway *gateway = nullptr);

        /// Route one request. Never throws; failures become error responses.
        [[nodiscard]] Response handle(const Request &req) const;

    private:
        struct Target;

        Response dispatch(const Request &req, const Target &target) const;

        Response post_message(const Request &req, const std::string &sid) const;
        Response post_batch(const Request &req, const std::string &sid) const;
        Response get_messages(const Request &req, const Target &target, const std::string &sid) const;
        Response get_sessions(const Request &req, const Target &target) const;
        Response get_session(const Request &req, const std::string &sid) const;
        Response create_session(const Request &req) const;
        Response rename_session(const Request &req, const std::string &sid) const;
        Response delete_session(const Request &req, const std::string &sid) const;
        Response reset_session(const Request &req, const std::string &sid) const;

        void publish(const std::string &sid, const std::string &messageId) const;

        std::shared_ptr<IMessageStore> store_;
        GatewayMetrics *metrics_;
        SyncGateway *gateway_;
    };

    /**
     * @brief Minimal asynchronous HTTP/1.1 server in front of an HttpApi.
     *
     * Runs on the io_context it is given; call stop() to close the acceptor.
     */
    class HttpServer
    {
    public:
        HttpServer(net::io_context &ioc, unsigned short port, const HttpApi &api);

        void start();
        void stop();

        [[nodiscard]] unsigned short port() const;

    private:
        void start_accept();

        net::io_context &ioc_;
        tcp::acceptor acceptor_;
        const HttpApi &api_;
        std::atomic<bool> stopRequested_{false};
    };

} // namespace convsync

#endif // CONVSYNC_HTTP_API_HPP
