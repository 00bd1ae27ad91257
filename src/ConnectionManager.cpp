#include <convsync/ConnectionManager.hpp>
#include <convsync/MergeEngine.hpp>
#include <convsync/errors.hpp>
#include <convsync/protocol.hpp>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        /// Epoch carried by a transport event, nullopt for local events.
        std::optional<std::uint64_t> epoch_of(const Event &ev)
        {
            return std::visit(
                overloaded{
                    [](const event::Opened &e) -> std::optional<std::uint64_t>
                    { return e.epoch; },
                    [](const event::Closed &e) -> std::optional<std::uint64_t>
                    { return e.epoch; },
                    [](const event::Frame &e) -> std::optional<std::uint64_t>
                    { return e.epoch; },
                    [](const auto &) -> std::optional<std::uint64_t>
                    { return std::nullopt; }},
                ev);
        }

        /// Request type a response frame answers, empty for other frames.
        std::string request_answered_by(const std::string &responseType)
        {
            if (responseType == envelope::kHistory)
                return envelope::kHistoryRequest;
            if (responseType == envelope::kSyncResponse)
                return envelope::kSyncRequest;
            return {};
        }
    } // namespace

    std::string_view to_string(ConnectionState state) noexcept
    {
        switch (state)
        {
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::ReconnectWait:
            return "reconnect_wait";
        case ConnectionState::Failed:
            return "failed";
        }
        return "unknown";
    }

    ConnectionManager::ConnectionManager(std::string sessionId,
                                         ITransport &transport,
                                         ITimer &timer,
                                         LocalCache &cache,
                                         ConnectionConfig cfg,
                                         std::uint32_t seed)
        : sessionId_(std::move(sessionId)),
          transport_(transport),
          timer_(timer),
          cache_(cache),
          cfg_(cfg),
          backoff_(cfg.backoff, seed),
          liveness_(
              timer,
              cfg.liveness,
              [this]()
              { transport_.send_text(Envelope::serialize(envelope::kHeartbeat)); },
              [this]()
              { handle_event(event::LivenessLost{}); })
    {
        if (!is_valid_session_id(sessionId_))
            throw ValidationError("invalid session id: '" + sessionId_ + "'");
    }

    // ───────────────────────── Dispatch ─────────────────────────

    void ConnectionManager::handle_event(const Event &ev)
    {
        if (std::holds_alternative<event::Close>(ev))
        {
            user_close();
            return;
        }

        if (auto e = epoch_of(ev); e && *e != epoch_)
        {
            logger.log(Logger::Level::DEBUG,
                       "[convsync][Connection] dropped event of stale epoch {} (current {})",
                       *e, epoch_);
            return;
        }

        switch (state_)
        {
        case ConnectionState::Disconnected:
            on_disconnected(ev);
            break;
        case ConnectionState::Connecting:
            on_connecting(ev);
            break;
        case ConnectionState::Connected:
            on_connected(ev);
            break;
        case ConnectionState::ReconnectWait:
            on_reconnect_wait(ev);
            break;
        case ConnectionState::Failed:
            break;
        }
    }

    void ConnectionManager::on_disconnected(const Event &ev)
    {
        if (std::holds_alternative<event::Connect>(ev) && !userClosed_)
            start_attempt();
    }

    void ConnectionManager::on_connecting(const Event &ev)
    {
        if (std::holds_alternative<event::Opened>(ev))
        {
            enter_connected();
        }
        else if (const auto *closed = std::get_if<event::Closed>(&ev))
        {
            schedule_reconnect(closed->reason);
        }
    }

    void ConnectionManager::on_connected(const Event &ev)
    {
        if (const auto *frame = std::get_if<event::Frame>(&ev))
        {
            liveness_.note_traffic();
            handle_frame(frame->text);
        }
        else if (const auto *closed = std::get_if<event::Closed>(&ev))
        {
            liveness_.stop();
            schedule_reconnect(closed->reason);
        }
        else if (std::holds_alternative<event::LivenessLost>(ev))
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Connection] {} unresponsive, dropping channel", sessionId_);

            liveness_.stop();
            ++epoch_;
            transport_.close();
            schedule_reconnect("liveness lost");
        }
    }

    void ConnectionManager::on_reconnect_wait(const Event &ev)
    {
        if (std::holds_alternative<event::RetryDue>(ev))
            start_attempt();
    }

    // ───────────────────────── Transitions ─────────────────────────

    void ConnectionManager::start_attempt()
    {
        ++epoch_;
        pending_.reset();
        transition(ConnectionState::Connecting);

        logger.log(Logger::Level::INFO,
                   "[convsync][Connection] {} connecting (epoch {}, attempt {})",
                   sessionId_, epoch_, attempts_);

        transport_.open(epoch_);
    }

    void ConnectionManager::enter_connected()
    {
        attempts_ = 0;
        transition(ConnectionState::Connected);
        liveness_.start();

        while (!outbound_.empty())
        {
            transport_.send_text(outbound_.front());
            outbound_.pop_front();
        }

        if (auto anchor = cache_.latest_confirmed(sessionId_))
        {
            transport_.send_text(Envelope::serialize(
                envelope::kSyncRequest,
                nlohmann::json{{"last_message_id", anchor->id},
                               {"timestamp", anchor->timestamp}}));
            pending_ = PendingRequest{envelope::kSyncRequest, epoch_};
        }
        else
        {
            transport_.send_text(Envelope::serialize(
                envelope::kHistoryRequest,
                nlohmann::json{{"limit", cfg_.historyLimit}}));
            pending_ = PendingRequest{envelope::kHistoryRequest, epoch_};
        }
    }

    void ConnectionManager::schedule_reconnect(const std::string &reason)
    {
        pending_.reset();

        if (attempts_ >= cfg_.maxAttempts)
        {
            logger.log(Logger::Level::ERROR,
                       "[convsync][Connection] {} giving up after {} attempts ({})",
                       sessionId_, attempts_, reason);

            timer_.cancel();
            transition(ConnectionState::Failed);
            cache_.flush();
            return;
        }

        const auto delay = backoff_.next(attempts_);
        ++attempts_;

        logger.log(Logger::Level::WARN,
                   "[convsync][Connection] {} lost ({}), retry {} in {} ms",
                   sessionId_, reason, attempts_, delay.count());

        transition(ConnectionState::ReconnectWait);
        timer_.arm(delay, [this]()
                   { handle_event(event::RetryDue{}); });
    }

    void ConnectionManager::user_close()
    {
        if (userClosed_)
            return;
        userClosed_ = true;

        liveness_.stop();
        timer_.cancel();
        pending_.reset();

        const bool hadChannel = state_ == ConnectionState::Connecting ||
                                state_ == ConnectionState::Connected;
        ++epoch_;
        if (hadChannel)
            transport_.close();

        if (state_ != ConnectionState::Failed)
            transition(ConnectionState::Disconnected);

        cache_.flush();

        logger.log(Logger::Level::INFO, "[convsync][Connection] {} closed by user", sessionId_);
    }

    void ConnectionManager::transition(ConnectionState next)
    {
        if (next == state_)
            return;

        const ConnectionState prev = state_;
        state_ = next;

        logger.log(Logger::Level::DEBUG, "[convsync][Connection] {} {} -> {}",
                   sessionId_, to_string(prev), to_string(next));

        if (onState_)
            onState_(prev, next);
    }

    // ───────────────────────── Inbound frames ─────────────────────────

    void ConnectionManager::handle_frame(const std::string &text)
    {
        auto env = Envelope::parse(text);
        if (!env)
        {
            logger.log(Logger::Level::WARN, "[convsync][Connection] malformed frame ignored");
            return;
        }

        if (env->type == envelope::kHeartbeat)
            return;

        if (env->type == envelope::kMessage)
        {
            auto msg = message_from_json(env->body);
            if (!msg || msg->id.empty())
            {
                logger.log(Logger::Level::WARN,
                           "[convsync][Connection] message frame without a valid message");
                return;
            }
            if (!msg->session_id.empty() && msg->session_id != sessionId_)
                return;

            cache_.upsert_confirmed(sessionId_, *msg);
            notify_update();
            return;
        }

        const std::string answers = request_answered_by(env->type);
        if (answers.empty())
        {
            logger.log(Logger::Level::DEBUG,
                       "[convsync][Connection] unknown frame type '{}' ignored", env->type);
            return;
        }

        if (!pending_ || pending_->epoch != epoch_ || pending_->type != answers)
        {
            logger.log(Logger::Level::DEBUG,
                       "[convsync][Connection] unsolicited '{}' discarded", env->type);
            return;
        }

        pending_.reset();

        auto it = env->body.find("messages");
        apply_response(env->type, it != env->body.end() ? *it : nlohmann::json::array());
    }

    void ConnectionManager::apply_response(const std::string &type, const nlohmann::json &messages)
    {
        std::vector<CachedMessage> remote;
        for (auto &m : messages_from_json(messages))
            remote.push_back(as_confirmed(m));

        auto merged = merge(cache_.read(sessionId_), remote);

        logger.log(Logger::Level::INFO,
                   "[convsync][Connection] {} {} applied: {} remote, {} total",
                   sessionId_, type, remote.size(), merged.size());

        cache_.replace(sessionId_, std::move(merged));
        notify_update();
    }

    void ConnectionManager::notify_update()
    {
        if (onUpdate_)
            onUpdate_(cache_.read(sessionId_));
    }

    // ───────────────────────── Public operations ─────────────────────────

    std::string ConnectionManager::send_message(const std::string &role,
                                                const std::string &content,
                                                std::optional<std::string> agentName,
                                                vix::json::kvs metadata)
    {
        auto parsed = parse_role(role);
        if (!parsed)
            throw ValidationError("invalid role: '" + role + "'");

        CachedMessage pending;
        pending.id = generate_uuid();
        pending.session_id = sessionId_;
        pending.role = *parsed;
        pending.content = content;
        pending.agent_name = std::move(agentName);
        pending.timestamp = now_millis();
        pending.metadata = std::move(metadata);
        pending.sync_state = SyncState::Pending;

        kvs_set_string(pending.metadata, kClientIdKey, pending.id);
        kvs_set_string(pending.metadata, kClientTimestampKey, std::to_string(pending.timestamp));

        nlohmann::json fields{
            {"role", role},
            {"content", pending.content},
            {"agent_name", pending.agent_name ? nlohmann::json(*pending.agent_name) : nlohmann::json(nullptr)},
            {"metadata", detail::kvs_to_nlohmann(pending.metadata)},
        };
        std::string frame = Envelope::serialize(envelope::kMessage, std::move(fields));

        const std::string id = pending.id;
        cache_.append(sessionId_, std::move(pending));

        if (state_ == ConnectionState::Connected)
        {
            transport_.send_text(frame);
        }
        else
        {
            outbound_.push_back(std::move(frame));
            logger.log(Logger::Level::DEBUG,
                       "[convsync][Connection] {} queued message {} ({} waiting)",
                       sessionId_, id, outbound_.size());
        }

        notify_update();
        return id;
    }

    void ConnectionManager::reset_session()
    {
        cache_.reset(sessionId_);
        notify_update();
    }

} // namespace convsync
