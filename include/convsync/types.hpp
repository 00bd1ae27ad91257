#ifndef CONVSYNC_TYPES_HPP
#define CONVSYNC_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data model: messages, sessions and cached messages.
 *
 * Timestamps are milliseconds since the Unix epoch. Within a session, the
 * store guarantees they never decrease once persisted.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <vix/json/Simple.hpp> // vix::json::kvs

namespace convsync
{
    enum class Role
    {
        User,
        Assistant,
        System
    };

    /// "user" | "assistant" | "system" → Role, anything else → nullopt.
    [[nodiscard]] std::optional<Role> parse_role(std::string_view text) noexcept;

    [[nodiscard]] std::string_view to_string(Role role) noexcept;

    /// Non-empty, at most 128 bytes, only [A-Za-z0-9._:-].
    [[nodiscard]] bool is_valid_session_id(std::string_view id) noexcept;

    /// Latest-message preview: 100 code points, "..." appended if cut.
    [[nodiscard]] std::string make_preview(std::string_view content);

    /// Default session label, e.g. "Session 1f0c2a9b".
    [[nodiscard]] std::string default_session_name(std::string_view sessionId);

    [[nodiscard]] std::int64_t now_millis();

    /// Random (v4) UUID in canonical textual form.
    [[nodiscard]] std::string generate_uuid();

    /// Metadata key carrying the provisional client-generated id.
    inline constexpr const char *kClientIdKey = "client_id";
    inline constexpr const char *kClientTimestampKey = "client_timestamp";

    /// payload[key] as string, or empty string if missing / not a string.
    [[nodiscard]] std::string kvs_get_string(const vix::json::kvs &kv, const std::string &key);

    /// Insert or overwrite payload[key] with a string value.
    void kvs_set_string(vix::json::kvs &kv, const std::string &key, const std::string &value);

    struct Message
    {
        std::string id; ///< server id once persisted, provisional id before
        std::string session_id;
        Role role{Role::User};
        std::string content;
        std::optional<std::string> agent_name;
        std::optional<std::string> user_id;
        std::int64_t timestamp{0};
        vix::json::kvs metadata;

        [[nodiscard]] std::string client_id() const
        {
            return kvs_get_string(metadata, kClientIdKey);
        }
    };

    struct Session
    {
        std::string session_id;
        std::string name;
        std::optional<std::string> user_id;
        std::int64_t created_at{0};
        std::optional<std::int64_t> last_message_at;
        std::optional<std::string> preview;
        bool is_active{true};
    };

    enum class SyncState
    {
        Pending,
        Confirmed
    };

    [[nodiscard]] std::string_view to_string(SyncState state) noexcept;

    struct CachedMessage : Message
    {
        SyncState sync_state{SyncState::Confirmed};
    };

    [[nodiscard]] inline CachedMessage as_confirmed(const Message &m)
    {
        CachedMessage c;
        static_cast<Message &>(c) = m;
        c.sync_state = SyncState::Confirmed;
        return c;
    }

} // namespace convsync

#endif // CONVSYNC_TYPES_HPP
