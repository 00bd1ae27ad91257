#ifndef CONVSYNC_CONFIG_HPP
#define CONVSYNC_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Strongly-typed configuration of the gateway and the client.
 *
 * @details
 * Wraps the core `vix::config::Config` (JSON file) into the structures used
 * by the server and client components. Every key is optional; values are
 * clamped to sane ranges. Host, port overrides and database paths come from
 * the command line of the executables.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <vix/config/Config.hpp>

#include <convsync/ConnectionManager.hpp>
#include <convsync/LocalCache.hpp>

namespace convsync
{
    /**
     * @struct GatewayConfig
     * @brief Tunables of the WebSocket gateway, the HTTP API and the store.
     */
    struct GatewayConfig
    {
        /// WebSocket listening port.
        std::uint16_t port = 9090;

        /// REST API listening port (0 = HTTP API disabled).
        std::uint16_t httpPort = 8080;

        /// Maximum accepted frame size in bytes.
        std::size_t maxMessageSize = 64 * 1024; // 64 KiB

        /// A channel without inbound traffic for this long is closed.
        /// Clients heartbeat every 30s, so three missed probes fit.
        std::chrono::seconds idleTimeout{90};

        /// Enable permessage-deflate compression if client supports it.
        bool enablePerMessageDeflate = true;

        /// I/O threads of the WebSocket listener (0 = hardware_concurrency / 2).
        std::size_t ioThreads = 0;

        /// SQLite connections kept by the persistent store, and workers running store calls.
        std::size_t storePoolSize = 4;

        /**
         * @brief Build a GatewayConfig from the core Vix config.
         *
         * Expected keys (optional):
         *  - gateway.port             (int)
         *  - gateway.http_port        (int, 0 disables the HTTP API)
         *  - gateway.max_message_size (int, bytes)
         *  - gateway.idle_timeout     (int, seconds)
         *  - gateway.enable_deflate   (bool)
         *  - gateway.io_threads       (int)
         *  - store.pool_size          (int)
         */
        static GatewayConfig from_core(const vix::config::Config &core);
    };

    /**
     * @struct ClientConfig
     * @brief Tunables of SyncClient (connection lifecycle and local cache).
     */
    struct ClientConfig
    {
        ConnectionConfig connection;
        LocalCacheConfig cache;

        /// Byte quota of the durable cache tier (0 = unlimited).
        std::size_t cacheQuotaBytes = 0;

        /**
         * Expected keys (optional):
         *  - client.reconnect_initial_ms, client.reconnect_max_ms,
         *    client.max_attempts
         *  - client.heartbeat_interval_ms, client.heartbeat_timeout_ms,
         *    client.heartbeat_max_missed
         *  - client.history_limit
         *  - client.cache_capacity, client.cache_debounce_ms,
         *    client.cache_evict_on_quota, client.cache_quota_bytes
         */
        static ClientConfig from_core(const vix::config::Config &core);
    };

} // namespace convsync

#endif // CONVSYNC_CONFIG_HPP
