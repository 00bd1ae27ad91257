#include <convsync/protocol.hpp>

namespace convsync
{
    namespace
    {
        nlohmann::json optional_string(const std::optional<std::string> &v)
        {
            if (!v)
                return nullptr;
            return *v;
        }

        std::optional<std::string> read_optional_string(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        }

        std::int64_t read_timestamp(const nlohmann::json &j)
        {
            auto it = j.find("timestamp");
            if (it == j.end())
                return 0;
            if (it->is_number_integer())
                return it->get<std::int64_t>();
            if (it->is_number_float())
                return static_cast<std::int64_t>(it->get<double>());
            return 0;
        }
    } // namespace

    nlohmann::json message_to_json(const Message &m)
    {
        return nlohmann::json{
            {"id", m.id},
            {"session_id", m.session_id},
            {"role", std::string{to_string(m.role)}},
            {"content", m.content},
            {"agent_name", optional_string(m.agent_name)},
            {"user_id", optional_string(m.user_id)},
            {"timestamp", m.timestamp},
            {"metadata", detail::kvs_to_nlohmann(m.metadata)},
        };
    }

    std::optional<Message> message_from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::nullopt;

        auto roleIt = j.find("role");
        if (roleIt == j.end() || !roleIt->is_string())
            return std::nullopt;

        auto role = parse_role(roleIt->get<std::string>());
        if (!role)
            return std::nullopt;

        auto contentIt = j.find("content");
        if (contentIt == j.end() || !contentIt->is_string())
            return std::nullopt;

        Message m;
        m.role = *role;
        m.content = contentIt->get<std::string>();
        m.id = read_optional_string(j, "id").value_or("");
        m.session_id = read_optional_string(j, "session_id").value_or("");
        m.agent_name = read_optional_string(j, "agent_name");
        m.user_id = read_optional_string(j, "user_id");
        m.timestamp = read_timestamp(j);

        if (auto it = j.find("metadata"); it != j.end())
            m.metadata = detail::nlohmann_to_kvs(*it);

        return m;
    }

    nlohmann::json messages_to_json(const std::vector<Message> &messages)
    {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &m : messages)
            arr.push_back(message_to_json(m));
        return arr;
    }

    std::vector<Message> messages_from_json(const nlohmann::json &arr)
    {
        std::vector<Message> out;
        if (!arr.is_array())
            return out;

        out.reserve(arr.size());
        for (const auto &item : arr)
        {
            if (auto m = message_from_json(item))
                out.push_back(std::move(*m));
        }
        return out;
    }

    nlohmann::json cached_message_to_json(const CachedMessage &m)
    {
        nlohmann::json j = message_to_json(m);
        j["sync_state"] = std::string{to_string(m.sync_state)};
        return j;
    }

    std::optional<CachedMessage> cached_message_from_json(const nlohmann::json &j)
    {
        auto m = message_from_json(j);
        if (!m)
            return std::nullopt;

        CachedMessage c = as_confirmed(*m);
        if (read_optional_string(j, "sync_state").value_or("") == "pending")
            c.sync_state = SyncState::Pending;
        return c;
    }

    std::string make_message_frame(const Message &m)
    {
        return Envelope::serialize(envelope::kMessage, message_to_json(m));
    }

    std::string make_messages_frame(const std::string &type,
                                    const std::vector<Message> &messages)
    {
        return Envelope::serialize(type, nlohmann::json{{"messages", messages_to_json(messages)}});
    }

} // namespace convsync
