#ifndef CONVSYNC_KEY_VALUE_STORAGE_HPP
#define CONVSYNC_KEY_VALUE_STORAGE_HPP

/**
 * @file KeyValueStorage.hpp
 * @brief Durable tier behind the client LocalCache.
 *
 *  - SqliteKeyValueStorage : file-backed, survives restarts, optional byte
 *                            quota (QuotaExceeded when a put would cross it)
 *  - MemoryKeyValueStorage : process-lifetime fallback
 */

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace convsync
{
    class IKeyValueStorage
    {
    public:
        virtual ~IKeyValueStorage() = default;

        [[nodiscard]] virtual std::optional<std::string> get(const std::string &key) = 0;

        /// Insert or overwrite. Throws QuotaExceeded when the tier is full.
        virtual void put(const std::string &key, const std::string &value) = 0;

        virtual void remove(const std::string &key) = 0;

        /// (key, value size in bytes) of every record whose key starts with `prefix`.
        [[nodiscard]] virtual std::vector<std::pair<std::string, std::size_t>>
        entries(const std::string &prefix) = 0;

        /// true when records survive the process.
        [[nodiscard]] virtual bool persistent() const noexcept = 0;
    };

    class MemoryKeyValueStorage : public IKeyValueStorage
    {
    public:
        MemoryKeyValueStorage() = default;

        std::optional<std::string> get(const std::string &key) override;
        void put(const std::string &key, const std::string &value) override;
        void remove(const std::string &key) override;
        std::vector<std::pair<std::string, std::size_t>> entries(const std::string &prefix) override;
        bool persistent() const noexcept override { return false; }

    private:
        std::mutex mutex_;
        std::map<std::string, std::string> records_;
    };

    class SqliteKeyValueStorage : public IKeyValueStorage
    {
    public:
        /// @param quotaBytes total value bytes allowed (0 = unlimited).
        explicit SqliteKeyValueStorage(const std::string &path, std::size_t quotaBytes = 0);
        ~SqliteKeyValueStorage() override;

        SqliteKeyValueStorage(const SqliteKeyValueStorage &) = delete;
        SqliteKeyValueStorage &operator=(const SqliteKeyValueStorage &) = delete;

        std::optional<std::string> get(const std::string &key) override;
        void put(const std::string &key, const std::string &value) override;
        void remove(const std::string &key) override;
        std::vector<std::pair<std::string, std::size_t>> entries(const std::string &prefix) override;
        bool persistent() const noexcept override { return persistent_; }

    private:
        std::mutex mutex_;
        sqlite3 *db_{nullptr};
        std::size_t quotaBytes_;
        bool persistent_;
    };

} // namespace convsync

#endif // CONVSYNC_KEY_VALUE_STORAGE_HPP
