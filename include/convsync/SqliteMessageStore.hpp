#ifndef CONVSYNC_SQLITE_MESSAGE_STORE_HPP
#define CONVSYNC_SQLITE_MESSAGE_STORE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <convsync/MessageStore.hpp>

namespace convsync
{
    /**
     * @brief SQLite (WAL) implementation of IMessageStore.
     *
     * Tables:
     *   sessions(session_id PK, name, user_id, created_at, last_message_at,
     *            preview, is_active)
     *   messages(seq PK AUTOINCREMENT, id UNIQUE, session_id FK, role,
     *            content, agent_name, user_id, timestamp, metadata_json)
     *
     * A small pool of connections lets different sessions proceed in
     * parallel; a per-session mutex orders writes within one session.
     * ":memory:" databases use a single connection.
     */
    class SqliteMessageStore : public IMessageStore
    {
    public:
        explicit SqliteMessageStore(const std::string &db_path, std::size_t pool_size = 4);
        ~SqliteMessageStore() override;

        SqliteMessageStore(const SqliteMessageStore &) = delete;
        SqliteMessageStore &operator=(const SqliteMessageStore &) = delete;
        SqliteMessageStore(SqliteMessageStore &&) = delete;
        SqliteMessageStore &operator=(SqliteMessageStore &&) = delete;

        void create_or_update_session(
            const std::string &session_id,
            const std::optional<std::string> &name = std::nullopt,
            const std::optional<std::string> &user_id = std::nullopt) override;

        std::string append_message(const std::string &session_id,
                                   const NewMessage &message) override;

        BatchResult append_messages(const std::string &session_id,
                                    const std::vector<NewMessage> &messages) override;

        [[nodiscard]] std::vector<Message> list_messages(
            const std::string &session_id,
            std::size_t limit = kDefaultMessageLimit,
            std::size_t offset = 0) override;

        [[nodiscard]] std::vector<Message> list_recent_messages(
            const std::string &session_id,
            std::size_t limit = kDefaultHistoryLimit) override;

        [[nodiscard]] std::optional<std::vector<Message>> list_messages_after(
            const std::string &session_id,
            const std::string &message_id) override;

        [[nodiscard]] std::vector<Session> list_sessions(
            const std::optional<std::string> &user_id = std::nullopt,
            std::size_t limit = kDefaultSessionLimit,
            std::size_t offset = 0) override;

        [[nodiscard]] std::optional<Session> get_session(const std::string &session_id) override;

        [[nodiscard]] std::optional<Message> get_message(const std::string &session_id,
                                                         const std::string &message_id) override;

        [[nodiscard]] std::int64_t get_message_count(const std::string &session_id) override;

        bool soft_delete_session(const std::string &session_id) override;

        bool reset_session_messages(const std::string &session_id) override;

    private:
        class ConnectionPool;

        std::unique_ptr<ConnectionPool> pool_;

        std::mutex locksMutex_;
        std::unordered_map<std::string, std::weak_ptr<std::mutex>> sessionLocks_;

        /// Mutex serializing writes of one session (created on demand).
        std::shared_ptr<std::mutex> session_lock(const std::string &session_id);
    };

} // namespace convsync

#endif // CONVSYNC_SQLITE_MESSAGE_STORE_HPP
