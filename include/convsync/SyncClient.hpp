#ifndef CONVSYNC_SYNC_CLIENT_HPP
#define CONVSYNC_SYNC_CLIENT_HPP

/**
 * @file SyncClient.hpp
 * @brief Ready-to-use client: one session kept in sync with a gateway.
 *
 * Owns an io_context running on a private thread, and on it:
 * the shared timer slot, the Beast transport, the LocalCache and the
 * ConnectionManager. Public calls are posted to that thread, so the
 * ConnectionManager only ever runs single-threaded.
 *
 * Typical usage:
 *
 *   convsync::SyncClient::Options opt;
 *   opt.host = "127.0.0.1";
 *   opt.port = "9090";
 *   opt.sessionId = "s1";
 *   opt.cachePath = "chat_cache.db";
 *
 *   convsync::SyncClient client(opt);
 *   client.on_update([](const auto &messages) { ... });
 *   client.start();
 *   client.send_message("user", "hello").get();
 *   client.close();
 */

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <convsync/ConnectionManager.hpp>
#include <convsync/KeyValueStorage.hpp>
#include <convsync/LocalCache.hpp>
#include <convsync/WsTransport.hpp>
#include <convsync/config.hpp>
#include <convsync/timer.hpp>

namespace convsync
{
    class SyncClient
    {
    public:
        struct Options
        {
            std::string host = "127.0.0.1";
            std::string port = "9090";
            std::string sessionId;

            /// SQLite file of the durable cache tier; empty keeps it in memory.
            std::string cachePath;

            ClientConfig config;
        };

        explicit SyncClient(Options options);
        ~SyncClient();

        SyncClient(const SyncClient &) = delete;
        SyncClient &operator=(const SyncClient &) = delete;

        /// Observers run on the client thread. Install them before start().
        void on_state_change(ConnectionManager::StateFn fn);
        void on_update(ConnectionManager::UpdateFn fn);

        /// Start the client thread and connect.
        void start();

        /// Close the channel for good, flush the cache and join the thread.
        void close();

        /// Provisional id of the queued message (ValidationError on bad role).
        std::future<std::string> send_message(std::string role,
                                              std::string content,
                                              std::optional<std::string> agentName = std::nullopt);

        void reset_session();

        [[nodiscard]] std::vector<CachedMessage> messages();
        [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
        [[nodiscard]] const std::string &session_id() const noexcept { return options_.sessionId; }

    private:
        void schedule_cache_tick();

        Options options_;

        boost::asio::io_context ioc_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

        std::shared_ptr<IKeyValueStorage> storage_;
        std::unique_ptr<LocalCache> cache_;
        AsioTimer timer_;
        std::unique_ptr<WsTransport> transport_;
        std::unique_ptr<ConnectionManager> manager_;
        boost::asio::steady_timer cacheTick_;

        ConnectionManager::StateFn userStateFn_;
        std::atomic<ConnectionState> state_{ConnectionState::Disconnected};

        std::thread thread_;
        std::atomic<bool> started_{false};
        std::atomic<bool> closed_{false};
    };

} // namespace convsync

#endif // CONVSYNC_SYNC_CLIENT_HPP
