#ifndef CONVSYNC_APP_HPP
#define CONVSYNC_APP_HPP

/**
 * @file App.hpp
 * @brief Gateway application wrapper.
 *
 * Wires together:
 *
 *   - vix::config::Config       (configuration loading)
 *   - SqliteMessageStore        (persistent store)
 *   - SyncGateway + Server      (WebSocket protocol on /ws/<session_id>)
 *   - HttpApi + HttpServer      (REST API, /metrics, /health)
 *
 * The HTTP API runs on its own io_context thread; the WebSocket listener
 * owns its own pool of I/O threads.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>

#include <vix/config/Config.hpp>

#include <convsync/HttpApi.hpp>
#include <convsync/Metrics.hpp>
#include <convsync/SqliteMessageStore.hpp>
#include <convsync/SyncGateway.hpp>
#include <convsync/config.hpp>
#include <convsync/server.hpp>

namespace convsync
{
    class App
    {
    public:
        /**
         * @param configPath  Path to a JSON config file (e.g. "config/config.json").
         * @param dbPath      SQLite database file of the persistent store.
         */
        App(const std::string &configPath, const std::string &dbPath);

        ~App();

        // Non-copyable / non-movable (owns store + servers + threads).
        App(const App &) = delete;
        App &operator=(const App &) = delete;
        App(App &&) = delete;
        App &operator=(App &&) = delete;

        /// Start both servers and block until stop() is called.
        void run_blocking();

        /// Stop both servers (callable from a signal-watching thread).
        void stop();

        [[nodiscard]] const GatewayConfig &config() const noexcept { return gatewayConfig_; }
        [[nodiscard]] SyncGateway &gateway() noexcept { return gateway_; }
        [[nodiscard]] GatewayMetrics &metrics() noexcept { return metrics_; }

    private:
        vix::config::Config config_;
        GatewayConfig gatewayConfig_;
        std::shared_ptr<SqliteMessageStore> store_;
        GatewayMetrics metrics_;
        SyncGateway gateway_;
        Server server_;
        HttpApi httpApi_;

        boost::asio::io_context httpIoc_;
        std::unique_ptr<HttpServer> httpServer_;
        std::thread httpThread_;

        std::atomic<bool> stopped_{false};
    };

} // namespace convsync

#endif // CONVSYNC_APP_HPP
