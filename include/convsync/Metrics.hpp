#ifndef CONVSYNC_METRICS_HPP
#define CONVSYNC_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Prometheus-style counters of the sync gateway.
 *
 * The gateway, the WebSocket channels and the HTTP API increment these
 * counters; `GET /metrics` on the HTTP API serves render_prometheus().
 *
 * @code{.cpp}
 * convsync::GatewayMetrics metrics;
 * convsync::SyncGateway gateway{store, &metrics};
 * // ...
 * std::cout << metrics.render_prometheus();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <string>

namespace convsync
{
    /**
     * @struct GatewayMetrics
     * @brief Aggregated counters for gateway activity.
     *
     * All fields are 64-bit atomics and can be incremented from the I/O
     * threads without external synchronization.
     */
    struct GatewayMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> frames_in_total{0};
        std::atomic<std::uint64_t> frames_out_total{0};
        std::atomic<std::uint64_t> frames_malformed_total{0};
        std::atomic<std::uint64_t> messages_persisted_total{0};
        std::atomic<std::uint64_t> history_requests_total{0};
        std::atomic<std::uint64_t> sync_requests_total{0};
        std::atomic<std::uint64_t> http_requests_total{0};
        std::atomic<std::uint64_t> errors_total{0};

        /**
         * @brief Render all counters in Prometheus text exposition format (v0.0.4).
         *
         * Intended to be served as "text/plain; version=0.0.4".
         */
        [[nodiscard]] std::string render_prometheus() const;
    };

} // namespace convsync

#endif // CONVSYNC_METRICS_HPP
