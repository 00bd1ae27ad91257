#ifndef CONVSYNC_CHANNEL_HPP
#define CONVSYNC_CHANNEL_HPP

/**
 * @file channel.hpp
 * @brief Per-connection WebSocket channel of the sync gateway.
 *
 * Responsibilities:
 *  - Read the HTTP upgrade request and bind the channel to the session id
 *    in its target (`/ws/<session_id>`).
 *  - Perform the WebSocket handshake; close with policy_error when the
 *    session id is malformed.
 *  - Read frames asynchronously and dispatch them to the Router.
 *  - Queue outbound text frames (one write in flight at a time).
 *  - Close the channel when no inbound traffic arrives within the idle
 *    timeout (heartbeats count as traffic).
 */

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/error_code.hpp>

#include <convsync/SyncGateway.hpp>
#include <convsync/config.hpp>
#include <convsync/router.hpp>

namespace convsync
{
    namespace beast = boost::beast;
    namespace http = boost::beast::http;
    namespace ws = boost::beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    /// Session id carried by a request target such as "/ws/abc?x=1".
    /// nullopt unless the target is /ws/<id> with a valid id.
    [[nodiscard]] std::optional<std::string> session_id_from_target(std::string_view target);

    class Channel : public IChannel, public std::enable_shared_from_this<Channel>
    {
    public:
        Channel(tcp::socket socket,
                const GatewayConfig &cfg,
                std::shared_ptr<Router> router);

        ~Channel() override = default;

        /// Read the upgrade request, handshake, then start the read loop.
        void run();

        [[nodiscard]] const std::string &session_id() const override { return sessionId_; }

        /// Send a text frame (thread-safe, posted to the channel's strand).
        void send_text(std::string_view text) override;

        /// Close the connection with a reason (optional).
        void close(ws::close_reason reason = ws::close_reason{});

    private:
        void do_read_request();
        void on_request(const boost::system::error_code &ec);
        void reject_request(http::status status, std::string body);

        void on_accept(const boost::system::error_code &ec);

        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void arm_idle_timer();
        void cancel_idle_timer();
        void on_idle_timeout(const boost::system::error_code &ec);

        void do_enqueue(std::string payload);
        void do_write_next();
        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);

        /// Report the close to the Router once, and only for opened channels.
        void notify_closed();

    private:
        ws::stream<tcp::socket> ws_;

        GatewayConfig cfg_;
        std::shared_ptr<Router> router_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> upgrade_;
        http::response<http::string_body> rejection_;

        std::string sessionId_;
        net::steady_timer idleTimer_;

        bool opened_ = false;
        bool closing_ = false;
        bool closeNotified_ = false;

        std::deque<std::string> writeQueue_;
        bool writeInProgress_ = false;
    };

} // namespace convsync

#endif // CONVSYNC_CHANNEL_HPP
