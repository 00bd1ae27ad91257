#ifndef CONVSYNC_LISTENER_HPP
#define CONVSYNC_LISTENER_HPP

/**
 * @file listener.hpp
 * @brief WebSocket accept loop of the gateway.
 *
 * This component:
 *  - owns the io_context and its I/O threads
 *  - accepts TCP connections, each on its own strand
 *  - creates a convsync::Channel for each client
 */

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/ip/tcp.hpp>

#include <convsync/config.hpp>
#include <convsync/router.hpp>

namespace convsync
{
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class Listener
    {
    public:
        Listener(const GatewayConfig &cfg, std::shared_ptr<Router> router);

        ~Listener();

        /// Start accepting connections and running io_context_ in background threads.
        void run();

        /// Cooperative async stop: close acceptor and stop io_context_.
        void stop_async();

        /// Join all I/O threads.
        void join_threads();

        [[nodiscard]] bool is_stop_requested() const { return stopRequested_.load(); }

        /// Bound port (differs from the configured one when it was 0).
        [[nodiscard]] unsigned short port() const;

    private:
        void init_acceptor(unsigned short port);
        void start_accept();
        void start_io_threads();

        [[nodiscard]] std::size_t compute_io_thread_count() const;

    private:
        GatewayConfig cfg_;
        std::shared_ptr<Router> router_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::vector<std::thread> ioThreads_;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace convsync

#endif // CONVSYNC_LISTENER_HPP
