#include <convsync/SyncGateway.hpp>
#include <convsync/errors.hpp>

#include <algorithm>

#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    namespace
    {
        void bump(std::atomic<std::uint64_t> GatewayMetrics::*field, GatewayMetrics *metrics)
        {
            if (metrics)
                (metrics->*field)++;
        }

        std::size_t requested_history_limit(const Envelope &env)
        {
            auto limit = env.get<long long>("limit");
            if (!limit || *limit <= 0)
                return kDefaultHistoryLimit;
            return std::min(static_cast<std::size_t>(*limit), kMaxMessageLimit);
        }
    } // namespace

    SyncGateway::SyncGateway(std::shared_ptr<IMessageStore> store, GatewayMetrics *metrics)
        : store_(std::move(store)),
          metrics_(metrics),
          channelsMutex_(),
          channels_()
    {
        if (!store_)
            throw std::invalid_argument("SyncGateway requires a message store");
    }

    // ───────────────────────── Channels registry ─────────────────────────

    void SyncGateway::attach(const std::shared_ptr<IChannel> &channel)
    {
        std::lock_guard<std::mutex> lock(channelsMutex_);

        auto &vec = channels_[channel->session_id()];
        vec.erase(std::remove_if(vec.begin(), vec.end(),
                                 [](const std::weak_ptr<IChannel> &w)
                                 { return w.expired(); }),
                  vec.end());
        vec.emplace_back(channel);

        logger.log(Logger::Level::INFO,
                   "[convsync][Gateway] channel attached to {} ({} open)",
                   channel->session_id(), vec.size());
    }

    void SyncGateway::detach(const IChannel &channel)
    {
        std::lock_guard<std::mutex> lock(channelsMutex_);

        auto it = channels_.find(channel.session_id());
        if (it == channels_.end())
            return;

        auto &vec = it->second;
        vec.erase(std::remove_if(vec.begin(), vec.end(),
                                 [&channel](const std::weak_ptr<IChannel> &w)
                                 {
                                     auto sp = w.lock();
                                     return !sp || sp.get() == &channel;
                                 }),
                  vec.end());

        if (vec.empty())
            channels_.erase(it);

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Gateway] channel detached from {}", channel.session_id());
    }

    std::size_t SyncGateway::channel_count(const std::string &session_id) const
    {
        std::lock_guard<std::mutex> lock(channelsMutex_);

        auto it = channels_.find(session_id);
        if (it == channels_.end())
            return 0;

        return static_cast<std::size_t>(
            std::count_if(it->second.begin(), it->second.end(),
                          [](const std::weak_ptr<IChannel> &w)
                          { return !w.expired(); }));
    }

    void SyncGateway::broadcast_except(const std::string &session_id,
                                       const IChannel *origin,
                                       const std::string &frame)
    {
        std::vector<std::shared_ptr<IChannel>> targets;
        {
            std::lock_guard<std::mutex> lock(channelsMutex_);

            auto it = channels_.find(session_id);
            if (it == channels_.end())
                return;

            for (auto &weak : it->second)
            {
                auto sp = weak.lock();
                if (sp && sp.get() != origin)
                    targets.push_back(std::move(sp));
            }
        }

        for (auto &ch : targets)
            send(*ch, frame);
    }

    void SyncGateway::publish(const Message &message)
    {
        broadcast_except(message.session_id, nullptr, make_message_frame(message));
    }

    void SyncGateway::send(IChannel &channel, const std::string &frame)
    {
        channel.send_text(frame);
        bump(&GatewayMetrics::frames_out_total, metrics_);
    }

    // ───────────────────────── Dispatch ─────────────────────────

    void SyncGateway::handle_text(IChannel &channel, std::string_view text)
    {
        bump(&GatewayMetrics::frames_in_total, metrics_);

        auto env = Envelope::parse(text);
        if (!env)
        {
            bump(&GatewayMetrics::frames_malformed_total, metrics_);
            logger.log(Logger::Level::WARN,
                       "[convsync][Gateway] malformed frame on {} dropped ({} bytes)",
                       channel.session_id(), text.size());
            return;
        }

        if (env->type == envelope::kMessage)
            on_message(channel, *env);
        else if (env->type == envelope::kHistoryRequest)
            on_history_request(channel, *env);
        else if (env->type == envelope::kSyncRequest)
            on_sync_request(channel, *env);
        else if (env->type == envelope::kHeartbeat)
            on_heartbeat(channel);
        else
        {
            bump(&GatewayMetrics::frames_malformed_total, metrics_);
            logger.log(Logger::Level::WARN,
                       "[convsync][Gateway] unknown frame type '{}' on {}",
                       env->type, channel.session_id());
        }
    }

    void SyncGateway::on_message(IChannel &channel, const Envelope &env)
    {
        const std::string &sessionId = channel.session_id();

        auto contentIt = env.body.find("content");
        if (contentIt == env.body.end() || !contentIt->is_string())
        {
            bump(&GatewayMetrics::frames_malformed_total, metrics_);
            logger.log(Logger::Level::WARN,
                       "[convsync][Gateway] message without string content on {}", sessionId);
            return;
        }

        NewMessage input;
        input.role = env.get_string("role");
        input.content = contentIt->get<std::string>();
        input.agent_name = env.get<std::string>("agent_name");
        input.user_id = env.get<std::string>("user_id");
        if (auto metaIt = env.body.find("metadata"); metaIt != env.body.end())
            input.metadata = detail::nlohmann_to_kvs(*metaIt);

        std::optional<Message> stored;
        try
        {
            const std::string id = store_->append_message(sessionId, input);
            bump(&GatewayMetrics::messages_persisted_total, metrics_);
            stored = store_->get_message(sessionId, id);
        }
        catch (const ValidationError &e)
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Gateway] message rejected on {}: {}", sessionId, e.what());
            return;
        }
        catch (const StorageUnavailable &e)
        {
            bump(&GatewayMetrics::errors_total, metrics_);
            logger.log(Logger::Level::ERROR,
                       "[convsync][Gateway] append failed on {}: {}", sessionId, e.what());
            return;
        }

        if (!stored)
        {
            bump(&GatewayMetrics::errors_total, metrics_);
            logger.log(Logger::Level::ERROR,
                       "[convsync][Gateway] appended message vanished on {}", sessionId);
            return;
        }

        const std::string frame = make_message_frame(*stored);
        send(channel, frame);
        broadcast_except(sessionId, &channel, frame);
    }

    void SyncGateway::on_history_request(IChannel &channel, const Envelope &env)
    {
        bump(&GatewayMetrics::history_requests_total, metrics_);

        const std::size_t limit = requested_history_limit(env);
        try
        {
            auto messages = store_->list_recent_messages(channel.session_id(), limit);
            send(channel, make_messages_frame(envelope::kHistory, messages));

            logger.log(Logger::Level::DEBUG,
                       "[convsync][Gateway] history {} -> {} messages",
                       channel.session_id(), messages.size());
        }
        catch (const SyncError &e)
        {
            bump(&GatewayMetrics::errors_total, metrics_);
            logger.log(Logger::Level::ERROR,
                       "[convsync][Gateway] history failed on {}: {}", channel.session_id(), e.what());
        }
    }

    void SyncGateway::on_sync_request(IChannel &channel, const Envelope &env)
    {
        bump(&GatewayMetrics::sync_requests_total, metrics_);

        const std::string &sessionId = channel.session_id();
        const std::string lastId = env.get_string("last_message_id");

        try
        {
            std::optional<std::vector<Message>> after;
            if (!lastId.empty())
                after = store_->list_messages_after(sessionId, lastId);

            if (!after)
            {
                logger.log(Logger::Level::INFO,
                           "[convsync][Gateway] sync anchor '{}' unknown on {}, sending recent history",
                           lastId, sessionId);
                after = store_->list_recent_messages(sessionId, kDefaultHistoryLimit);
            }

            send(channel, make_messages_frame(envelope::kSyncResponse, *after));
        }
        catch (const SyncError &e)
        {
            bump(&GatewayMetrics::errors_total, metrics_);
            logger.log(Logger::Level::ERROR,
                       "[convsync][Gateway] sync failed on {}: {}", sessionId, e.what());
        }
    }

    void SyncGateway::on_heartbeat(IChannel &channel)
    {
        send(channel, Envelope::serialize(envelope::kHeartbeat));
    }

} // namespace convsync
