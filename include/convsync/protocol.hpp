#ifndef CONVSYNC_PROTOCOL_HPP
#define CONVSYNC_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief JSON envelope of the session synchronization protocol.
 *
 * One JSON object per WebSocket text frame, flat, with a mandatory "type":
 *
 *   client → server
 *     { "type": "message", "role": "user", "content": "hi",
 *       "agent_name": null, "metadata": { "client_id": "..." } }
 *     { "type": "history_request", "limit": 50 }
 *     { "type": "sync_request", "last_message_id": "...", "timestamp": 1700000000000 }
 *     { "type": "heartbeat" }
 *
 *   server → client
 *     { "type": "message", "id": "...", "session_id": "...", "role": "...",
 *       "content": "...", "agent_name": ..., "timestamp": ..., "metadata": {...} }
 *     { "type": "history",       "messages": [ ... ] }
 *     { "type": "sync_response", "messages": [ ... ] }
 *     { "type": "heartbeat" }
 *
 * Messages inside "messages" use the same field names as the "message"
 * confirmation, without "type".
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <vix/json/Simple.hpp> // vix::json::token / kvs

#include <convsync/types.hpp>

namespace convsync
{
    namespace envelope
    {
        inline constexpr const char *kMessage = "message";
        inline constexpr const char *kHistoryRequest = "history_request";
        inline constexpr const char *kHistory = "history";
        inline constexpr const char *kSyncRequest = "sync_request";
        inline constexpr const char *kSyncResponse = "sync_response";
        inline constexpr const char *kHeartbeat = "heartbeat";
    } // namespace envelope

    namespace detail
    {
        inline nlohmann::json token_to_nlohmann(const vix::json::token &t)
        {
            nlohmann::json j = nullptr;
            std::visit(
                [&](auto &&val)
                {
                    using T = std::decay_t<decltype(val)>;
                    if constexpr (std::is_same_v<T, std::monostate>)
                    {
                        j = nullptr;
                    }
                    else if constexpr (std::is_same_v<T, bool> ||
                                       std::is_same_v<T, long long> ||
                                       std::is_same_v<T, double> ||
                                       std::is_same_v<T, std::string>)
                    {
                        j = val;
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<vix::json::array_t>>)
                    {
                        if (!val)
                        {
                            j = nullptr;
                            return;
                        }
                        j = nlohmann::json::array();
                        for (const auto &el : val->elems)
                        {
                            j.push_back(token_to_nlohmann(el));
                        }
                    }
                    else if constexpr (std::is_same_v<T, std::shared_ptr<vix::json::kvs>>)
                    {
                        if (!val)
                        {
                            j = nullptr;
                            return;
                        }
                        nlohmann::json obj = nlohmann::json::object();
                        const auto &a = val->flat;
                        const std::size_t n = a.size() - (a.size() % 2);
                        for (std::size_t i = 0; i < n; i += 2)
                        {
                            const auto &k = a[i].v;
                            if (!std::holds_alternative<std::string>(k))
                                continue;
                            obj[std::get<std::string>(k)] = token_to_nlohmann(a[i + 1]);
                        }
                        j = std::move(obj);
                    }
                    else
                    {
                        j = nullptr;
                    }
                },
                t.v);
            return j;
        }

        inline nlohmann::json kvs_to_nlohmann(const vix::json::kvs &list)
        {
            nlohmann::json obj = nlohmann::json::object();
            const auto &a = list.flat;
            const std::size_t n = a.size() - (a.size() % 2);

            for (std::size_t i = 0; i < n; i += 2)
            {
                const auto &k = a[i].v;
                if (!std::holds_alternative<std::string>(k))
                    continue;

                obj[std::get<std::string>(k)] = token_to_nlohmann(a[i + 1]);
            }
            return obj;
        }

        /// Flat object → kvs. Nested arrays/objects are kept as their JSON text.
        inline vix::json::kvs nlohmann_to_kvs(const nlohmann::json &obj)
        {
            vix::json::kvs kv;

            if (!obj.is_object())
                return kv;

            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                const nlohmann::json &val = *it;

                kv.flat.emplace_back(vix::json::token{it.key()});

                if (val.is_string())
                    kv.flat.emplace_back(vix::json::token{val.get<std::string>()});
                else if (val.is_boolean())
                    kv.flat.emplace_back(vix::json::token{val.get<bool>()});
                else if (val.is_number_integer())
                    kv.flat.emplace_back(vix::json::token{val.get<long long>()});
                else if (val.is_number_float())
                    kv.flat.emplace_back(vix::json::token{val.get<double>()});
                else if (val.is_null())
                    kv.flat.emplace_back(vix::json::token{});
                else
                    kv.flat.emplace_back(vix::json::token{val.dump()});
            }

            return kv;
        }

    } // namespace detail

    /// Parsed protocol frame: the type plus the whole JSON object.
    struct Envelope
    {
        std::string type;
        nlohmann::json body = nlohmann::json::object();

        /// body[key] as string, or empty string if missing / not a string.
        [[nodiscard]] std::string get_string(const std::string &key) const
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string())
                return {};
            return it->get<std::string>();
        }

        /// Typed getter; nullopt when missing or of another JSON type.
        template <typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const
        {
            auto it = body.find(key);
            if (it == body.end() || it->is_null())
                return std::nullopt;
            try
            {
                return it->get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                return std::nullopt;
            }
        }

        /// nullopt for non-JSON text, non-objects and objects without a
        /// string "type".
        static std::optional<Envelope> parse(std::string_view text)
        {
            nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded() || !j.is_object())
                return std::nullopt;

            auto it = j.find("type");
            if (it == j.end() || !it->is_string())
                return std::nullopt;

            Envelope env;
            env.type = it->get<std::string>();
            if (env.type.empty())
                return std::nullopt;

            env.body = std::move(j);
            return env;
        }

        /// Serialize { "type": type, ...fields } to a compact JSON string.
        static std::string serialize(const std::string &type,
                                     nlohmann::json fields = nlohmann::json::object())
        {
            if (!fields.is_object())
                fields = nlohmann::json::object();
            fields["type"] = type;
            return fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
    };

    // ---- Message codecs ----------------------------------------------------

    [[nodiscard]] nlohmann::json message_to_json(const Message &m);

    /// Shape-checked decode: role must be one of the three values and
    /// content must be a string. Other fields are optional.
    [[nodiscard]] std::optional<Message> message_from_json(const nlohmann::json &j);

    [[nodiscard]] nlohmann::json messages_to_json(const std::vector<Message> &messages);

    /// Decode an array, dropping entries that fail message_from_json.
    [[nodiscard]] std::vector<Message> messages_from_json(const nlohmann::json &arr);

    [[nodiscard]] nlohmann::json cached_message_to_json(const CachedMessage &m);
    [[nodiscard]] std::optional<CachedMessage> cached_message_from_json(const nlohmann::json &j);

    /// server → client confirmation / broadcast of a persisted message.
    [[nodiscard]] std::string make_message_frame(const Message &m);

    /// "history" or "sync_response" frame carrying a message list.
    [[nodiscard]] std::string make_messages_frame(const std::string &type,
                                                  const std::vector<Message> &messages);

} // namespace convsync

#endif // CONVSYNC_PROTOCOL_HPP
