#include <convsync/KeyValueStorage.hpp>
#include <convsync/errors.hpp>

#include <vix/utils/Logger.hpp>

#include "sqlite_support.hpp"

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    // ───────────────────────── Memory tier ─────────────────────────

    std::optional<std::string> MemoryKeyValueStorage::get(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(key);
        if (it == records_.end())
            return std::nullopt;
        return it->second;
    }

    void MemoryKeyValueStorage::put(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[key] = value;
    }

    void MemoryKeyValueStorage::remove(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(key);
    }

    std::vector<std::pair<std::string, std::size_t>> MemoryKeyValueStorage::entries(const std::string &prefix)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::pair<std::string, std::size_t>> out;
        for (auto it = records_.lower_bound(prefix); it != records_.end(); ++it)
        {
            if (it->first.compare(0, prefix.size(), prefix) != 0)
                break;
            out.emplace_back(it->first, it->second.size());
        }
        return out;
    }

    // ───────────────────────── SQLite tier ─────────────────────────

    SqliteKeyValueStorage::SqliteKeyValueStorage(const std::string &path, std::size_t quotaBytes)
        : quotaBytes_(quotaBytes),
          persistent_(!path.empty() && path != ":memory:")
    {
        const std::string target = path.empty() ? std::string{":memory:"} : path;

        int rc = sqlite3_open(target.c_str(), &db_);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteKeyValueStorage] Failed to open DB: ";
            msg += db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
            if (db_)
                sqlite3_close(db_);
            db_ = nullptr;
            throw StorageUnavailable(msg);
        }

        try
        {
            sqlite::exec(db_, "PRAGMA journal_mode=WAL;", "set WAL");
            sqlite::exec(db_,
                         "CREATE TABLE IF NOT EXISTS kv ("
                         "  key   TEXT PRIMARY KEY,"
                         "  value TEXT NOT NULL"
                         ");",
                         "create kv table");
        }
        catch (const StorageUnavailable &)
        {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        logger.log(Logger::Level::DEBUG,
                   "[convsync][KeyValue] opened '{}' (quota={} bytes)", target, quotaBytes_);
    }

    SqliteKeyValueStorage::~SqliteKeyValueStorage()
    {
        if (db_)
            sqlite3_close(db_);
    }

    std::optional<std::string> SqliteKeyValueStorage::get(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement st(db_, "SELECT value FROM kv WHERE key = ?1;");
        st.bind_text(1, key);
        if (!st.step("kv get"))
            return std::nullopt;
        return st.text(0);
    }

    void SqliteKeyValueStorage::put(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (quotaBytes_ > 0)
        {
            sqlite::Statement st(db_, "SELECT COALESCE(SUM(LENGTH(CAST(value AS BLOB))), 0) FROM kv WHERE key <> ?1;");
            st.bind_text(1, key);
            std::int64_t used = 0;
            if (st.step("kv usage"))
                used = st.int64(0);

            if (static_cast<std::size_t>(used) + value.size() > quotaBytes_)
            {
                throw QuotaExceeded("[SqliteKeyValueStorage] quota of " + std::to_string(quotaBytes_) +
                                    " bytes exceeded writing '" + key + "'");
            }
        }

        sqlite::Statement st(db_, "INSERT OR REPLACE INTO kv (key, value) VALUES (?1, ?2);");
        st.bind_text(1, key);
        st.bind_text(2, value);
        st.step("kv put");
    }

    void SqliteKeyValueStorage::remove(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement st(db_, "DELETE FROM kv WHERE key = ?1;");
        st.bind_text(1, key);
        st.step("kv remove");
    }

    std::vector<std::pair<std::string, std::size_t>> SqliteKeyValueStorage::entries(const std::string &prefix)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        sqlite::Statement st(db_,
                             "SELECT key, LENGTH(CAST(value AS BLOB)) FROM kv "
                             "WHERE substr(key, 1, length(?1)) = ?1 ORDER BY key;");
        st.bind_text(1, prefix);

        std::vector<std::pair<std::string, std::size_t>> out;
        while (st.step("kv entries"))
            out.emplace_back(st.text(0), static_cast<std::size_t>(st.int64(1)));
        return out;
    }

} // namespace convsync
