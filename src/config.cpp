#include <convsync/config.hpp>

#include <algorithm>

namespace convsync
{
    namespace
    {
        int clamp_int(const vix::config::Config &core, const char *key, int def, int lo, int hi)
        {
            return std::clamp(core.getInt(key, def), lo, hi);
        }

        std::chrono::milliseconds clamp_ms(const vix::config::Config &core,
                                           const char *key,
                                           std::chrono::milliseconds def,
                                           int lo,
                                           int hi)
        {
            return std::chrono::milliseconds(clamp_int(core, key, static_cast<int>(def.count()), lo, hi));
        }
    } // namespace

    GatewayConfig GatewayConfig::from_core(const vix::config::Config &core)
    {
        GatewayConfig cfg;

        if (core.has("gateway.port"))
            cfg.port = static_cast<std::uint16_t>(clamp_int(core, "gateway.port", cfg.port, 1, 65535));

        if (core.has("gateway.http_port"))
            cfg.httpPort = static_cast<std::uint16_t>(clamp_int(core, "gateway.http_port", cfg.httpPort, 0, 65535));

        if (core.has("gateway.max_message_size"))
        {
            auto v = core.getInt("gateway.max_message_size", static_cast<int>(cfg.maxMessageSize));
            cfg.maxMessageSize = static_cast<std::size_t>(std::max(1024, v)); // min 1 KiB
        }

        if (core.has("gateway.idle_timeout"))
        {
            auto v = core.getInt("gateway.idle_timeout", static_cast<int>(cfg.idleTimeout.count()));
            cfg.idleTimeout = std::chrono::seconds(v <= 0 ? 0 : std::max(5, v)); // 0 = no idle close
        }

        if (core.has("gateway.enable_deflate"))
            cfg.enablePerMessageDeflate = core.getBool("gateway.enable_deflate", cfg.enablePerMessageDeflate);

        if (core.has("gateway.io_threads"))
            cfg.ioThreads = static_cast<std::size_t>(clamp_int(core, "gateway.io_threads", 0, 0, 256));

        if (core.has("store.pool_size"))
            cfg.storePoolSize = static_cast<std::size_t>(clamp_int(core, "store.pool_size", 4, 1, 64));

        return cfg;
    }

    ClientConfig ClientConfig::from_core(const vix::config::Config &core)
    {
        ClientConfig cfg;
        auto &conn = cfg.connection;

        conn.backoff.initialDelay = clamp_ms(core, "client.reconnect_initial_ms",
                                             conn.backoff.initialDelay, 10, 600000);
        conn.backoff.maxDelay = clamp_ms(core, "client.reconnect_max_ms",
                                         conn.backoff.maxDelay, 10, 3600000);
        conn.backoff.maxDelay = std::max(conn.backoff.maxDelay, conn.backoff.initialDelay);

        conn.maxAttempts = static_cast<std::size_t>(
            clamp_int(core, "client.max_attempts", static_cast<int>(conn.maxAttempts), 1, 1000));

        conn.liveness.interval = clamp_ms(core, "client.heartbeat_interval_ms",
                                          conn.liveness.interval, 100, 3600000);
        conn.liveness.timeout = clamp_ms(core, "client.heartbeat_timeout_ms",
                                         conn.liveness.timeout, 50, 600000);
        conn.liveness.timeout = std::min(conn.liveness.timeout, conn.liveness.interval);
        conn.liveness.maxMissed = static_cast<std::size_t>(
            clamp_int(core, "client.heartbeat_max_missed", static_cast<int>(conn.liveness.maxMissed), 1, 100));

        conn.historyLimit = static_cast<std::size_t>(
            clamp_int(core, "client.history_limit", static_cast<int>(conn.historyLimit), 1, 500));

        cfg.cache.capacity = static_cast<std::size_t>(
            clamp_int(core, "client.cache_capacity", static_cast<int>(cfg.cache.capacity), 1, 10000));
        cfg.cache.debounce = clamp_ms(core, "client.cache_debounce_ms", cfg.cache.debounce, 0, 60000);
        cfg.cache.evictOnQuota = static_cast<std::size_t>(
            clamp_int(core, "client.cache_evict_on_quota", static_cast<int>(cfg.cache.evictOnQuota), 1, 100));

        if (core.has("client.cache_quota_bytes"))
            cfg.cacheQuotaBytes = static_cast<std::size_t>(
                std::max(0, core.getInt("client.cache_quota_bytes", 0)));

        return cfg;
    }

} // namespace convsync
