#ifndef CONVSYNC_CONNECTION_MANAGER_HPP
#define CONVSYNC_CONNECTION_MANAGER_HPP

/**
 * @file ConnectionManager.hpp
 * @brief Client-side lifecycle of the channel to the sync gateway.
 *
 * @details
 * An explicit state machine driven through a single handle_event() entry
 * point:
 *
 *   Disconnected ──Connect──> Connecting ──Opened──> Connected
 *        ^                        │                      │
 *        │                     Closed              Closed / LivenessLost
 *      Close                      v                      v
 *  (any state)              ReconnectWait <──────────────┘
 *                                 │ RetryDue
 *                                 └──> Connecting ... ──> Failed
 *
 * Transport events carry the epoch of the connection attempt that produced
 * them; events of an older epoch are dropped. Each close bumps the epoch.
 *
 * The reconnect delay and the heartbeat share one timer slot: the timer is
 * armed by the LivenessMonitor while Connected and by the reconnect logic
 * while in ReconnectWait, never both.
 *
 * Not thread-safe: every call runs on the owner's event loop.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <convsync/Backoff.hpp>
#include <convsync/LivenessMonitor.hpp>
#include <convsync/LocalCache.hpp>
#include <convsync/MessageStore.hpp>
#include <convsync/timer.hpp>
#include <convsync/types.hpp>

namespace convsync
{
    enum class ConnectionState
    {
        Disconnected,
        Connecting,
        Connected,
        ReconnectWait,
        Failed
    };

    [[nodiscard]] std::string_view to_string(ConnectionState state) noexcept;

    namespace event
    {
        /// User asks to connect.
        struct Connect
        {
        };

        /// User closes the client; terminal.
        struct Close
        {
        };

        struct Opened
        {
            std::uint64_t epoch = 0;
        };

        /// Connect failure or unexpected close of an open channel.
        struct Closed
        {
            std::uint64_t epoch = 0;
            std::string reason;
        };

        struct Frame
        {
            std::uint64_t epoch = 0;
            std::string text;
        };

        struct RetryDue
        {
        };

        struct LivenessLost
        {
        };
    } // namespace event

    using Event = std::variant<event::Connect,
                               event::Close,
                               event::Opened,
                               event::Closed,
                               event::Frame,
                               event::RetryDue,
                               event::LivenessLost>;

    /**
     * @brief Duplex text channel to the gateway, as seen by the client.
     *
     * open(epoch) starts one connection attempt; the implementation reports
     * its outcome (Opened, Frame, Closed) tagged with that epoch.
     */
    class ITransport
    {
    public:
        virtual ~ITransport() = default;

        virtual void open(std::uint64_t epoch) = 0;
        virtual void close() = 0;
        virtual void send_text(const std::string &text) = 0;
    };

    struct ConnectionConfig
    {
        BackoffPolicy backoff;
        std::size_t maxAttempts = 10;
        LivenessConfig liveness;
        std::size_t historyLimit = kDefaultHistoryLimit;
    };

    class ConnectionManager
    {
    public:
        using StateFn = std::function<void(ConnectionState from, ConnectionState to)>;
        using UpdateFn = std::function<void(const std::vector<CachedMessage> &messages)>;

        ConnectionManager(std::string sessionId,
                          ITransport &transport,
                          ITimer &timer,
                          LocalCache &cache,
                          ConnectionConfig cfg = {},
                          std::uint32_t seed = std::random_device{}());

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        void handle_event(const Event &ev);

        void connect() { handle_event(event::Connect{}); }
        void close() { handle_event(event::Close{}); }

        /**
         * @brief Queue a user/assistant/system message for delivery.
         *
         * The message is cached as pending under a provisional id (also
         * stored as metadata.client_id) and sent now if connected, otherwise
         * on the next successful connect.
         *
         * @return the provisional id.
         * @throws ValidationError if `role` is not user/assistant/system.
         */
        std::string send_message(const std::string &role,
                                 const std::string &content,
                                 std::optional<std::string> agentName = std::nullopt,
                                 vix::json::kvs metadata = {});

        /// Forget the locally cached messages of the session.
        void reset_session();

        void on_state_change(StateFn fn) { onState_ = std::move(fn); }
        void on_update(UpdateFn fn) { onUpdate_ = std::move(fn); }

        [[nodiscard]] ConnectionState state() const noexcept { return state_; }
        [[nodiscard]] std::size_t attempts() const noexcept { return attempts_; }
        [[nodiscard]] std::uint64_t epoch() const noexcept { return epoch_; }
        [[nodiscard]] std::size_t queued() const noexcept { return outbound_.size(); }
        [[nodiscard]] const std::string &session_id() const noexcept { return sessionId_; }

    private:
        struct PendingRequest
        {
            std::string type;
            std::uint64_t epoch = 0;
        };

        // per-state handlers
        void on_disconnected(const Event &ev);
        void on_connecting(const Event &ev);
        void on_connected(const Event &ev);
        void on_reconnect_wait(const Event &ev);

        void start_attempt();
        void enter_connected();
        void schedule_reconnect(const std::string &reason);
        void user_close();

        void handle_frame(const std::string &text);
        void apply_response(const std::string &type, const nlohmann::json &messages);

        void transition(ConnectionState next);
        void notify_update();

        std::string sessionId_;
        ITransport &transport_;
        ITimer &timer_;
        LocalCache &cache_;
        ConnectionConfig cfg_;

        Backoff backoff_;
        LivenessMonitor liveness_;

        ConnectionState state_ = ConnectionState::Disconnected;
        std::size_t attempts_ = 0;
        std::uint64_t epoch_ = 0;
        bool userClosed_ = false;

        std::optional<PendingRequest> pending_;
        std::deque<std::string> outbound_;

        StateFn onState_;
        UpdateFn onUpdate_;
    };

} // namespace convsync

#endif // CONVSYNC_CONNECTION_MANAGER_HPP
