#ifndef CONVSYNC_SQLITE_SUPPORT_HPP
#define CONVSYNC_SQLITE_SUPPORT_HPP

// RAII helpers over the SQLite C API, shared by the message store and the
// client's durable key/value tier. Every failure throws StorageUnavailable.

#include <cstdint>
#include <optional>
#include <string>

#include <sqlite3.h>
#include <vix/utils/Logger.hpp>

#include <convsync/errors.hpp>

namespace convsync::sqlite
{
    [[noreturn]] inline void throw_sqlite(sqlite3 *db, const char *stage)
    {
        std::string msg = "[sqlite] ";
        msg += stage;
        msg += " error: ";
        msg += db ? sqlite3_errmsg(db) : "no connection";
        throw StorageUnavailable(msg);
    }

    inline void sqlite_check(int rc, sqlite3 *db, const char *stage)
    {
        if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE)
            throw_sqlite(db, stage);
    }

    inline void exec(sqlite3 *db, const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[sqlite] ";
            msg += stage;
            msg += " error: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            throw StorageUnavailable(msg);
        }
    }

    class Statement
    {
    public:
        Statement(sqlite3 *db, const char *sql)
            : db_(db)
        {
            int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
            sqlite_check(rc, db_, "prepare");
        }

        ~Statement()
        {
            if (stmt_)
                sqlite3_finalize(stmt_);
        }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void bind_text(int idx, const std::string &value)
        {
            sqlite_check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT),
                         db_, "bind text");
        }

        void bind_optional_text(int idx, const std::optional<std::string> &value)
        {
            if (value)
                bind_text(idx, *value);
            else
                sqlite_check(sqlite3_bind_null(stmt_, idx), db_, "bind null");
        }

        void bind_int64(int idx, std::int64_t value)
        {
            sqlite_check(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)),
                         db_, "bind int64");
        }

        /// true on SQLITE_ROW, false on SQLITE_DONE, throws otherwise.
        bool step(const char *stage)
        {
            int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW)
                return true;
            if (rc == SQLITE_DONE)
                return false;
            throw_sqlite(db_, stage);
        }

        [[nodiscard]] bool is_null(int col) const
        {
            return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
        }

        [[nodiscard]] std::string text(int col) const
        {
            const unsigned char *p = sqlite3_column_text(stmt_, col);
            return p ? std::string{reinterpret_cast<const char *>(p)} : std::string{};
        }

        [[nodiscard]] std::optional<std::string> optional_text(int col) const
        {
            if (is_null(col))
                return std::nullopt;
            return text(col);
        }

        [[nodiscard]] std::int64_t int64(int col) const
        {
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
        }

    private:
        sqlite3 *db_{nullptr};
        sqlite3_stmt *stmt_{nullptr};
    };

    /// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran.
    class Transaction
    {
    public:
        explicit Transaction(sqlite3 *db)
            : db_(db)
        {
            exec(db_, "BEGIN IMMEDIATE;", "begin");
        }

        ~Transaction()
        {
            if (!committed_)
            {
                int rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
                if (rc != SQLITE_OK)
                {
                    vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::ERROR,
                                                          "[convsync][sqlite] rollback failed: {}",
                                                          sqlite3_errmsg(db_));
                }
            }
        }

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void commit()
        {
            exec(db_, "COMMIT;", "commit");
            committed_ = true;
        }

    private:
        sqlite3 *db_;
        bool committed_{false};
    };

} // namespace convsync::sqlite

#endif // CONVSYNC_SQLITE_SUPPORT_HPP
