#include <convsync/SqliteMessageStore.hpp>
#include <convsync/errors.hpp>
#include <convsync/protocol.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>

#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <vix/utils/Logger.hpp>

#include "sqlite_support.hpp"

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    // ───────────────────────── Helpers internes ─────────────────────────

    namespace
    {
        using sqlite::exec;
        using sqlite::Statement;
        using sqlite::Transaction;

        constexpr int kBusyTimeoutMs = 5000;

        constexpr const char *kMessageColumns =
            "SELECT id, session_id, role, content, agent_name, user_id, timestamp, metadata_json "
            "FROM messages ";

        constexpr const char *kSessionColumns =
            "SELECT session_id, name, user_id, created_at, last_message_at, preview, is_active "
            "FROM sessions ";

        Message read_message(const Statement &st)
        {
            Message m;
            m.id = st.text(0);
            m.session_id = st.text(1);
            m.role = parse_role(st.text(2)).value_or(Role::User);
            m.content = st.text(3);
            m.agent_name = st.optional_text(4);
            m.user_id = st.optional_text(5);
            m.timestamp = st.int64(6);

            auto meta = nlohmann::json::parse(st.text(7), nullptr, /*allow_exceptions=*/false);
            if (!meta.is_discarded())
                m.metadata = detail::nlohmann_to_kvs(meta);

            return m;
        }

        Session read_session(const Statement &st)
        {
            Session s;
            s.session_id = st.text(0);
            s.name = st.text(1);
            s.user_id = st.optional_text(2);
            s.created_at = st.int64(3);
            if (!st.is_null(4))
                s.last_message_at = st.int64(4);
            s.preview = st.optional_text(5);
            s.is_active = st.int64(6) != 0;
            return s;
        }

        std::vector<Message> collect_messages(Statement &st, const char *stage)
        {
            std::vector<Message> out;
            while (st.step(stage))
                out.push_back(read_message(st));
            return out;
        }

        void require_session_id(const std::string &session_id)
        {
            if (!is_valid_session_id(session_id))
                throw ValidationError("malformed session id: '" + session_id + "'");
        }

        /// Creates the session row with defaults if it does not exist.
        void ensure_session_row(sqlite3 *db,
                                const std::string &session_id,
                                const std::optional<std::string> &user_id,
                                std::int64_t now)
        {
            Statement st(db,
                         "INSERT OR IGNORE INTO sessions "
                         "(session_id, name, user_id, created_at, is_active) "
                         "VALUES (?1, ?2, ?3, ?4, 1);");
            st.bind_text(1, session_id);
            st.bind_text(2, default_session_name(session_id));
            st.bind_optional_text(3, user_id);
            st.bind_int64(4, now);
            st.step("insert session");
        }

        std::string append_in_transaction(sqlite3 *db,
                                          const std::string &session_id,
                                          Role role,
                                          const NewMessage &message)
        {
            Transaction tx(db);

            const std::int64_t now = now_millis();
            ensure_session_row(db, session_id, message.user_id, now);

            std::int64_t timestamp = now;
            {
                Statement st(db, "SELECT MAX(timestamp) FROM messages WHERE session_id = ?1;");
                st.bind_text(1, session_id);
                if (st.step("select last timestamp") && !st.is_null(0))
                    timestamp = std::max(timestamp, st.int64(0));
            }

            const std::string id = generate_uuid();
            const std::string metadataText = detail::kvs_to_nlohmann(message.metadata)
                                                 .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

            {
                Statement st(db,
                             "INSERT INTO messages "
                             "(id, session_id, role, content, agent_name, user_id, timestamp, metadata_json) "
                             "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
                st.bind_text(1, id);
                st.bind_text(2, session_id);
                st.bind_text(3, std::string{to_string(role)});
                st.bind_text(4, message.content);
                st.bind_optional_text(5, message.agent_name);
                st.bind_optional_text(6, message.user_id);
                st.bind_int64(7, timestamp);
                st.bind_text(8, metadataText);
                st.step("insert message");
            }

            if (role != Role::System)
            {
                Statement st(db,
                             "UPDATE sessions SET last_message_at = ?2, preview = ?3 "
                             "WHERE session_id = ?1;");
                st.bind_text(1, session_id);
                st.bind_int64(2, timestamp);
                st.bind_text(3, make_preview(message.content));
                st.step("update session metadata");

                if (sqlite3_changes(db) != 1)
                    throw StorageUnavailable("[SqliteMessageStore] session metadata update affected no row");
            }

            tx.commit();
            return id;
        }

    } // namespace

    // ───────────────────────── Connection pool ─────────────────────────

    class SqliteMessageStore::ConnectionPool
    {
    public:
        class Lease
        {
        public:
            Lease(ConnectionPool &pool, sqlite3 *db)
                : pool_(pool), db_(db)
            {
            }

            ~Lease()
            {
                pool_.release(db_);
            }

            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;

            [[nodiscard]] sqlite3 *get() const noexcept { return db_; }

        private:
            ConnectionPool &pool_;
            sqlite3 *db_;
        };

        ConnectionPool(const std::string &path, std::size_t size)
        {
            const bool inMemory = path.empty() || path == ":memory:";
            const std::size_t n = inMemory ? 1 : std::max<std::size_t>(1, size);

            try
            {
                for (std::size_t i = 0; i < n; ++i)
                {
                    sqlite3 *db = open_one(path);
                    all_.push_back(db);
                    idle_.push_back(db);

                    // Schema must exist before the other connections look at it.
                    if (i == 0)
                        init_schema(db);
                }
            }
            catch (const std::exception &)
            {
                close_all();
                throw;
            }
        }

        ~ConnectionPool()
        {
            close_all();
        }

        Lease acquire()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]
                     { return !idle_.empty(); });
            sqlite3 *db = idle_.back();
            idle_.pop_back();
            return Lease{*this, db};
        }

    private:
        void release(sqlite3 *db)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                idle_.push_back(db);
            }
            cv_.notify_one();
        }

        static sqlite3 *open_one(const std::string &path)
        {
            sqlite3 *db = nullptr;
            const std::string target = path.empty() ? std::string{":memory:"} : path;
            int rc = sqlite3_open_v2(target.c_str(), &db,
                                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                     nullptr);
            if (rc != SQLITE_OK)
            {
                std::string msg = "[SqliteMessageStore] Failed to open DB: ";
                msg += sqlite3_errstr(rc);
                if (db)
                    sqlite3_close(db);
                throw StorageUnavailable(msg);
            }

            sqlite3_busy_timeout(db, kBusyTimeoutMs);

            try
            {
                exec(db, "PRAGMA journal_mode=WAL;", "set WAL");
                exec(db, "PRAGMA foreign_keys=ON;", "enable foreign keys");
            }
            catch (const StorageUnavailable &)
            {
                sqlite3_close(db);
                throw;
            }
            return db;
        }

        static void init_schema(sqlite3 *db)
        {
            const char *sql =
                "CREATE TABLE IF NOT EXISTS sessions ("
                "  session_id      TEXT PRIMARY KEY,"
                "  name            TEXT NOT NULL,"
                "  user_id         TEXT,"
                "  created_at      INTEGER NOT NULL,"
                "  last_message_at INTEGER,"
                "  preview         TEXT,"
                "  is_active       INTEGER NOT NULL DEFAULT 1"
                ");"
                "CREATE TABLE IF NOT EXISTS messages ("
                "  seq           INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  id            TEXT NOT NULL UNIQUE,"
                "  session_id    TEXT NOT NULL REFERENCES sessions(session_id),"
                "  role          TEXT NOT NULL CHECK (role IN ('user', 'assistant', 'system')),"
                "  content       TEXT NOT NULL,"
                "  agent_name    TEXT,"
                "  user_id       TEXT,"
                "  timestamp     INTEGER NOT NULL,"
                "  metadata_json TEXT NOT NULL DEFAULT '{}'"
                ");"
                "CREATE INDEX IF NOT EXISTS idx_messages_session_ts "
                "  ON messages(session_id, timestamp, seq);"
                "CREATE INDEX IF NOT EXISTS idx_sessions_user_active "
                "  ON sessions(user_id, is_active);";

            exec(db, sql, "create schema");
        }

        void close_all() noexcept
        {
            for (sqlite3 *db : all_)
                sqlite3_close(db);
            all_.clear();
            idle_.clear();
        }

        std::mutex mutex_;
        std::condition_variable cv_;
        std::vector<sqlite3 *> all_;
        std::vector<sqlite3 *> idle_;
    };

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteMessageStore::SqliteMessageStore(const std::string &db_path, std::size_t pool_size)
        : pool_(std::make_unique<ConnectionPool>(db_path, pool_size))
    {
        logger.log(Logger::Level::INFO,
                   "[convsync][Store] opened '{}' (pool={})", db_path, pool_size);
    }

    SqliteMessageStore::~SqliteMessageStore() = default;

    std::shared_ptr<std::mutex> SqliteMessageStore::session_lock(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(locksMutex_);

        if (sessionLocks_.size() > 1024)
        {
            for (auto it = sessionLocks_.begin(); it != sessionLocks_.end();)
            {
                if (it->second.expired())
                    it = sessionLocks_.erase(it);
                else
                    ++it;
            }
        }

        auto &weak = sessionLocks_[session_id];
        auto sp = weak.lock();
        if (!sp)
        {
            sp = std::make_shared<std::mutex>();
            weak = sp;
        }
        return sp;
    }

    // ───────────────────────── Sessions ─────────────────────────

    void SqliteMessageStore::create_or_update_session(const std::string &session_id,
                                                      const std::optional<std::string> &name,
                                                      const std::optional<std::string> &user_id)
    {
        require_session_id(session_id);

        auto sessionMutex = session_lock(session_id);
        std::lock_guard<std::mutex> guard(*sessionMutex);
        auto lease = pool_->acquire();
        sqlite3 *db = lease.get();

        Transaction tx(db);

        bool exists = false;
        {
            Statement st(db, "SELECT 1 FROM sessions WHERE session_id = ?1;");
            st.bind_text(1, session_id);
            exists = st.step("select session");
        }

        if (exists)
        {
            Statement st(db,
                         "UPDATE sessions SET "
                         "  name = COALESCE(?2, name),"
                         "  user_id = COALESCE(?3, user_id),"
                         "  is_active = 1 "
                         "WHERE session_id = ?1;");
            st.bind_text(1, session_id);
            st.bind_optional_text(2, name);
            st.bind_optional_text(3, user_id);
            st.step("update session");
        }
        else
        {
            Statement st(db,
                         "INSERT INTO sessions (session_id, name, user_id, created_at, is_active) "
                         "VALUES (?1, ?2, ?3, ?4, 1);");
            st.bind_text(1, session_id);
            st.bind_text(2, name.value_or(default_session_name(session_id)));
            st.bind_optional_text(3, user_id);
            st.bind_int64(4, now_millis());
            st.step("insert session");
        }

        tx.commit();

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Store] session {} {}", session_id, exists ? "updated" : "created");
    }

    std::optional<Session> SqliteMessageStore::get_session(const std::string &session_id)
    {
        auto lease = pool_->acquire();

        Statement st(lease.get(), (std::string(kSessionColumns) + "WHERE session_id = ?1;").c_str());
        st.bind_text(1, session_id);
        if (!st.step("get_session"))
            return std::nullopt;
        return read_session(st);
    }

    std::vector<Session> SqliteMessageStore::list_sessions(const std::optional<std::string> &user_id,
                                                           std::size_t limit,
                                                           std::size_t offset)
    {
        std::vector<Session> out;
        limit = std::min(limit, kMaxSessionLimit);
        if (limit == 0)
            return out;

        auto lease = pool_->acquire();

        const std::string sql = std::string(kSessionColumns) +
                                "WHERE is_active = 1 AND (?1 IS NULL OR user_id = ?1) "
                                "ORDER BY COALESCE(last_message_at, created_at) DESC, created_at DESC "
                                "LIMIT ?2 OFFSET ?3;";

        Statement st(lease.get(), sql.c_str());
        st.bind_optional_text(1, user_id);
        st.bind_int64(2, static_cast<std::int64_t>(limit));
        st.bind_int64(3, static_cast<std::int64_t>(offset));

        while (st.step("list_sessions"))
            out.push_back(read_session(st));

        return out;
    }

    bool SqliteMessageStore::soft_delete_session(const std::string &session_id)
    {
        require_session_id(session_id);

        auto sessionMutex = session_lock(session_id);
        std::lock_guard<std::mutex> guard(*sessionMutex);
        auto lease = pool_->acquire();

        Statement st(lease.get(), "UPDATE sessions SET is_active = 0 WHERE session_id = ?1;");
        st.bind_text(1, session_id);
        st.step("soft delete session");

        const bool found = sqlite3_changes(lease.get()) > 0;
        logger.log(Logger::Level::INFO,
                   "[convsync][Store] soft delete {} ({})", session_id, found ? "ok" : "not found");
        return found;
    }

    bool SqliteMessageStore::reset_session_messages(const std::string &session_id)
    {
        require_session_id(session_id);

        auto sessionMutex = session_lock(session_id);
        std::lock_guard<std::mutex> guard(*sessionMutex);
        auto lease = pool_->acquire();
        sqlite3 *db = lease.get();

        Transaction tx(db);

        {
            Statement st(db,
                         "UPDATE sessions SET preview = NULL, last_message_at = NULL "
                         "WHERE session_id = ?1;");
            st.bind_text(1, session_id);
            st.step("reset session metadata");
        }

        if (sqlite3_changes(db) == 0)
            return false; // rolled back by ~Transaction, nothing was changed

        {
            Statement st(db, "DELETE FROM messages WHERE session_id = ?1;");
            st.bind_text(1, session_id);
            st.step("purge messages");
        }

        const int purged = sqlite3_changes(db);
        tx.commit();

        logger.log(Logger::Level::INFO,
                   "[convsync][Store] reset {} ({} messages purged)", session_id, purged);
        return true;
    }

    // ───────────────────────── append ─────────────────────────

    std::string SqliteMessageStore::append_message(const std::string &session_id,
                                                   const NewMessage &message)
    {
        require_session_id(session_id);

        auto role = parse_role(message.role);
        if (!role)
            throw ValidationError("invalid role: '" + message.role + "'");

        auto sessionMutex = session_lock(session_id);
        std::lock_guard<std::mutex> guard(*sessionMutex);
        auto lease = pool_->acquire();

        std::string id = append_in_transaction(lease.get(), session_id, *role, message);

        logger.log(Logger::Level::DEBUG,
                   "[convsync][Store] appended {} ({}) to {}", id, message.role, session_id);
        return id;
    }

    BatchResult SqliteMessageStore::append_messages(const std::string &session_id,
                                                    const std::vector<NewMessage> &messages)
    {
        if (messages.empty())
            throw ValidationError("empty message batch");

        BatchResult result;
        std::exception_ptr lastError;

        for (const auto &m : messages)
        {
            try
            {
                result.ids.push_back(append_message(session_id, m));
            }
            catch (const SyncError &e)
            {
                ++result.failed;
                lastError = std::current_exception();
                logger.log(Logger::Level::WARN,
                           "[convsync][Store] batch item rejected for {}: {}", session_id, e.what());
            }
        }

        if (result.ids.empty() && lastError)
            std::rethrow_exception(lastError);

        return result;
    }

    // ───────────────────────── list ─────────────────────────

    std::vector<Message> SqliteMessageStore::list_messages(const std::string &session_id,
                                                           std::size_t limit,
                                                           std::size_t offset)
    {
        limit = std::min(limit, kMaxMessageLimit);
        if (limit == 0)
            return {};

        auto lease = pool_->acquire();

        const std::string sql = std::string(kMessageColumns) +
                                "WHERE session_id = ?1 "
                                "ORDER BY timestamp ASC, seq ASC "
                                "LIMIT ?2 OFFSET ?3;";

        Statement st(lease.get(), sql.c_str());
        st.bind_text(1, session_id);
        st.bind_int64(2, static_cast<std::int64_t>(limit));
        st.bind_int64(3, static_cast<std::int64_t>(offset));

        return collect_messages(st, "list_messages");
    }

    std::vector<Message> SqliteMessageStore::list_recent_messages(const std::string &session_id,
                                                                  std::size_t limit)
    {
        limit = std::min(limit, kMaxMessageLimit);
        if (limit == 0)
            return {};

        auto lease = pool_->acquire();

        // newest-first from SQLite, then flipped to oldest-first
        const std::string sql = std::string(kMessageColumns) +
                                "WHERE session_id = ?1 "
                                "ORDER BY timestamp DESC, seq DESC "
                                "LIMIT ?2;";

        Statement st(lease.get(), sql.c_str());
        st.bind_text(1, session_id);
        st.bind_int64(2, static_cast<std::int64_t>(limit));

        auto out = collect_messages(st, "list_recent_messages");
        std::reverse(out.begin(), out.end());
        return out;
    }

    std::optional<std::vector<Message>> SqliteMessageStore::list_messages_after(
        const std::string &session_id,
        const std::string &message_id)
    {
        auto lease = pool_->acquire();
        sqlite3 *db = lease.get();

        std::int64_t anchorTs = 0;
        std::int64_t anchorSeq = 0;
        {
            Statement st(db, "SELECT timestamp, seq FROM messages WHERE session_id = ?1 AND id = ?2;");
            st.bind_text(1, session_id);
            st.bind_text(2, message_id);
            if (!st.step("locate anchor"))
                return std::nullopt;
            anchorTs = st.int64(0);
            anchorSeq = st.int64(1);
        }

        const std::string sql = std::string(kMessageColumns) +
                                "WHERE session_id = ?1 "
                                "  AND (timestamp > ?2 OR (timestamp = ?2 AND seq > ?3)) "
                                "ORDER BY timestamp ASC, seq ASC;";

        Statement st(db, sql.c_str());
        st.bind_text(1, session_id);
        st.bind_int64(2, anchorTs);
        st.bind_int64(3, anchorSeq);

        return collect_messages(st, "list_messages_after");
    }

    std::optional<Message> SqliteMessageStore::get_message(const std::string &session_id,
                                                           const std::string &message_id)
    {
        auto lease = pool_->acquire();

        const std::string sql = std::string(kMessageColumns) + "WHERE session_id = ?1 AND id = ?2;";
        Statement st(lease.get(), sql.c_str());
        st.bind_text(1, session_id);
        st.bind_text(2, message_id);
        if (!st.step("get_message"))
            return std::nullopt;
        return read_message(st);
    }

    std::int64_t SqliteMessageStore::get_message_count(const std::string &session_id)
    {
        auto lease = pool_->acquire();

        Statement st(lease.get(), "SELECT COUNT(*) FROM messages WHERE session_id = ?1;");
        st.bind_text(1, session_id);
        if (!st.step("count messages"))
            return 0;
        return st.int64(0);
    }

} // namespace convsync
