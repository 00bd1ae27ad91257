#ifndef CONVSYNC_SERVER_HPP
#define CONVSYNC_SERVER_HPP

/**
 * @file server.hpp
 * @brief WebSocket front of the sync gateway.
 *
 * Wires the Listener's Router to a SyncGateway: opened channels are
 * attached to their session, inbound frames go to SyncGateway::handle_text
 * on the Dispatcher's workers (one strand per channel), closed channels are
 * detached.
 */

#include <memory>

#include <convsync/Metrics.hpp>
#include <convsync/SyncGateway.hpp>
#include <convsync/config.hpp>
#include <convsync/dispatcher.hpp>
#include <convsync/listener.hpp>
#include <convsync/router.hpp>

namespace convsync
{
    class Server
    {
    public:
        Server(const GatewayConfig &cfg,
               SyncGateway &gateway,
               GatewayMetrics *metrics = nullptr);

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        void start();

        void stop();

        /// start() then block until stop() is called from another thread.
        void listen_blocking();

        [[nodiscard]] unsigned short port() const { return listener_.port(); }

    private:
        void install_handlers();

        SyncGateway &gateway_;
        GatewayMetrics *metrics_;
        std::shared_ptr<Router> router_;
        Dispatcher dispatcher_;
        Listener listener_;
    };

} // namespace convsync

#endif // CONVSYNC_SERVER_HPP
