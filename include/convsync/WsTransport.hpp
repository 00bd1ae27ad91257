#ifndef CONVSYNC_WS_TRANSPORT_HPP
#define CONVSYNC_WS_TRANSPORT_HPP

/**
 * @file WsTransport.hpp
 * @brief Boost.Beast WebSocket client implementing ITransport.
 *
 * Each open(epoch) runs a fresh pipeline (resolve, connect, handshake on
 * `/ws/<session_id>`, read loop) and reports its outcome through the sink:
 *
 *   Opened{epoch}              handshake succeeded
 *   Frame{epoch, text}         one per inbound text frame
 *   Closed{epoch, reason}      once, on any failure or remote close
 *
 * close() silences the current connection: nothing more is reported for
 * its epoch. Reconnect policy belongs to ConnectionManager, not here.
 *
 * Not thread-safe: call it from the io_context thread.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include <convsync/ConnectionManager.hpp>

namespace convsync
{
    class WsTransport : public ITransport
    {
    public:
        using Sink = std::function<void(Event)>;

        WsTransport(boost::asio::io_context &ioc,
                    std::string host,
                    std::string port,
                    std::string sessionId,
                    Sink sink);

        ~WsTransport() override;

        WsTransport(const WsTransport &) = delete;
        WsTransport &operator=(const WsTransport &) = delete;

        void open(std::uint64_t epoch) override;
        void close() override;
        void send_text(const std::string &text) override;

        /// Replace the event sink (set before the first open()).
        void set_sink(Sink sink) { sink_ = std::move(sink); }

    private:
        class Connection;

        boost::asio::io_context &ioc_;
        std::string host_;
        std::string port_;
        std::string target_;
        Sink sink_;

        std::shared_ptr<Connection> current_;
    };

} // namespace convsync

#endif // CONVSYNC_WS_TRANSPORT_HPP
