#ifndef CONVSYNC_MESSAGE_STORE_HPP
#define CONVSYNC_MESSAGE_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <vix/json/Simple.hpp>

#include <convsync/types.hpp>

namespace convsync
{
    inline constexpr std::size_t kDefaultMessageLimit = 200;
    inline constexpr std::size_t kMaxMessageLimit = 500;
    inline constexpr std::size_t kDefaultSessionLimit = 20;
    inline constexpr std::size_t kMaxSessionLimit = 100;
    inline constexpr std::size_t kDefaultHistoryLimit = 50;

    /// Input of append_message, as supplied by the agent runtime or a client.
    struct NewMessage
    {
        std::string role; ///< validated by the store
        std::string content;
        std::optional<std::string> agent_name;
        std::optional<std::string> user_id;
        vix::json::kvs metadata;
    };

    struct BatchResult
    {
        std::vector<std::string> ids; ///< ids of the appended items, in order
        std::size_t failed{0};
    };

    /**
     * @brief Durable message log + session metadata table.
     *
     * Semantics:
     *  - append_message inserts the message and updates the owning session's
     *    last_message_at / preview (user and assistant roles) atomically.
     *    Throws ValidationError (bad session id or role) or
     *    StorageUnavailable (backend failure, nothing is persisted).
     *  - list_* return messages oldest-first; limits above the maximum are
     *    clamped.
     *  - list_sessions returns active sessions, most recently active first.
     *  - Appends to the same session are serialized; different sessions do
     *    not contend on a shared lock.
     */
    class IMessageStore
    {
    public:
        virtual ~IMessageStore() = default;

        /// Upsert: non-null fields overwrite, is_active forced to true.
        virtual void create_or_update_session(
            const std::string &session_id,
            const std::optional<std::string> &name = std::nullopt,
            const std::optional<std::string> &user_id = std::nullopt) = 0;

        /// Returns the server-assigned message id.
        virtual std::string append_message(const std::string &session_id,
                                           const NewMessage &message) = 0;

        /// Appends each item on its own; throws only if none succeeded.
        virtual BatchResult append_messages(const std::string &session_id,
                                            const std::vector<NewMessage> &messages) = 0;

        virtual std::vector<Message> list_messages(
            const std::string &session_id,
            std::size_t limit = kDefaultMessageLimit,
            std::size_t offset = 0) = 0;

        /// The most recent `limit` messages, oldest-first.
        virtual std::vector<Message> list_recent_messages(
            const std::string &session_id,
            std::size_t limit = kDefaultHistoryLimit) = 0;

        /// Every message strictly after `message_id`, oldest-first.
        /// nullopt when `message_id` is not a message of this session.
        virtual std::optional<std::vector<Message>> list_messages_after(
            const std::string &session_id,
            const std::string &message_id) = 0;

        virtual std::vector<Session> list_sessions(
            const std::optional<std::string> &user_id = std::nullopt,
            std::size_t limit = kDefaultSessionLimit,
            std::size_t offset = 0) = 0;

        virtual std::optional<Session> get_session(const std::string &session_id) = 0;

        /// A persisted message of `session_id`, as stored (server timestamp).
        virtual std::optional<Message> get_message(const std::string &session_id,
                                                   const std::string &message_id) = 0;

        virtual std::int64_t get_message_count(const std::string &session_id) = 0;

        /// false if the session does not exist.
        virtual bool soft_delete_session(const std::string &session_id) = 0;

        /// Purges the session's messages and clears its preview.
        /// false if the session does not exist.
        virtual bool reset_session_messages(const std::string &session_id) = 0;
    };

} // namespace convsync

#endif // CONVSYNC_MESSAGE_STORE_HPP
