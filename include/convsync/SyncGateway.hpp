#ifndef CONVSYNC_SYNC_GATEWAY_HPP
#define CONVSYNC_SYNC_GATEWAY_HPP

/**
 * @file SyncGateway.hpp
 * @brief Server-side protocol handler for the session synchronization protocol.
 *
 * The gateway is transport-agnostic: a channel is anything that knows the
 * session it is bound to and can send a text frame. The Beast WebSocket
 * Channel implements IChannel; tests use an in-memory channel.
 *
 * Frames handled (see protocol.hpp):
 *  - message          → append, confirm on the origin channel, fan out to
 *                       the other channels of the same session
 *  - history_request  → history (most recent `limit`, oldest-first)
 *  - sync_request     → sync_response (strictly after `last_message_id`,
 *                       or the default history if the id is unknown)
 *  - heartbeat        → heartbeat echo
 *
 * Malformed frames and unknown types are logged and dropped; the channel
 * stays open.
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <convsync/Metrics.hpp>
#include <convsync/MessageStore.hpp>
#include <convsync/protocol.hpp>

namespace convsync
{
    /// One client connection, bound to exactly one session id.
    class IChannel
    {
    public:
        virtual ~IChannel() = default;

        [[nodiscard]] virtual const std::string &session_id() const = 0;

        /// Thread-safe; frames are delivered in call order.
        virtual void send_text(std::string_view text) = 0;
    };

    class SyncGateway
    {
    public:
        explicit SyncGateway(std::shared_ptr<IMessageStore> store,
                             GatewayMetrics *metrics = nullptr);

        SyncGateway(const SyncGateway &) = delete;
        SyncGateway &operator=(const SyncGateway &) = delete;

        /// Register an open channel under its session id.
        void attach(const std::shared_ptr<IChannel> &channel);

        /// Forget a channel (no-op if it was never attached).
        void detach(const IChannel &channel);

        /// Dispatch one inbound text frame received on `channel`.
        void handle_text(IChannel &channel, std::string_view text);

        /// Send a persisted message to every channel of its session.
        void publish(const Message &message);

        [[nodiscard]] std::size_t channel_count(const std::string &session_id) const;

        [[nodiscard]] IMessageStore &store() noexcept { return *store_; }

    private:
        void on_message(IChannel &channel, const Envelope &env);
        void on_history_request(IChannel &channel, const Envelope &env);
        void on_sync_request(IChannel &channel, const Envelope &env);
        void on_heartbeat(IChannel &channel);

        void send(IChannel &channel, const std::string &frame);

        /// Send `frame` to every live channel of `session_id` except `origin`.
        void broadcast_except(const std::string &session_id,
                              const IChannel *origin,
                              const std::string &frame);

        std::shared_ptr<IMessageStore> store_;
        GatewayMetrics *metrics_;

        mutable std::mutex channelsMutex_;
        std::unordered_map<std::string, std::vector<std::weak_ptr<IChannel>>> channels_;
    };

} // namespace convsync

#endif // CONVSYNC_SYNC_GATEWAY_HPP
