#ifndef CONVSYNC_LOCAL_CACHE_HPP
#define CONVSYNC_LOCAL_CACHE_HPP

/**
 * @file LocalCache.hpp
 * @brief Client-side bounded mirror of each session's messages.
 *
 * The cache is a hint: the gateway's answers always win. Each session keeps
 * at most `capacity` entries, oldest evicted first.
 *
 * Durable writes are debounced: a mutation marks the session dirty and
 * (re)sets its deadline to now + debounce; tick(now) writes the full list
 * of every session whose deadline has passed, once. flush() writes all
 * dirty sessions immediately and the destructor flushes.
 *
 * When the durable tier reports QuotaExceeded the cache evicts the largest
 * `evictOnQuota` records and retries once, then falls back to an in-memory
 * tier for the rest of the process lifetime. No error reaches the caller.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <convsync/KeyValueStorage.hpp>
#include <convsync/types.hpp>

namespace convsync
{
    struct LocalCacheConfig
    {
        std::size_t capacity = 200;
        std::chrono::milliseconds debounce{300};
        std::size_t evictOnQuota = 3;
        std::string keyPrefix = "convsync_chat_";
    };

    class LocalCache
    {
    public:
        using Clock = std::chrono::steady_clock;
        using NowFn = std::function<Clock::time_point()>;

        explicit LocalCache(std::shared_ptr<IKeyValueStorage> durable,
                            LocalCacheConfig cfg = {},
                            NowFn now = {});

        ~LocalCache();

        LocalCache(const LocalCache &) = delete;
        LocalCache &operator=(const LocalCache &) = delete;

        /// Cached entries of `session_id`, oldest-first.
        [[nodiscard]] std::vector<CachedMessage> read(const std::string &session_id);

        void append(const std::string &session_id, CachedMessage message);

        /// Replace the whole list (result of a merge).
        void replace(const std::string &session_id, std::vector<CachedMessage> messages);

        /**
         * @brief Record a server-confirmed message.
         *
         * Overwrites the entry with the same id, or the pending entry whose
         * provisional id equals the message's client_id; appends otherwise.
         */
        void upsert_confirmed(const std::string &session_id, const Message &message);

        /// Most recent confirmed entry (the sync anchor), if any.
        [[nodiscard]] std::optional<CachedMessage> latest_confirmed(const std::string &session_id);

        /// Drop every entry of the session, in memory and in the durable tier.
        void reset(const std::string &session_id);

        /// Write every session whose debounce deadline is at or before `now`.
        void tick(Clock::time_point now);
        void tick() { tick(now_()); }

        /// Write every dirty session immediately.
        void flush();

        [[nodiscard]] std::size_t size(const std::string &session_id);
        [[nodiscard]] bool dirty(const std::string &session_id) const;

        /// false once the cache fell back to the in-memory tier.
        [[nodiscard]] bool persistent() const;

        [[nodiscard]] const LocalCacheConfig &config() const noexcept { return cfg_; }

    private:
        struct Entry
        {
            std::vector<CachedMessage> messages;
            std::optional<Clock::time_point> deadline;
            bool loaded = true; ///< false while the stored record could not be read
        };

        bool fetch_locked(const std::string &session_id, std::vector<CachedMessage> &out);
        Entry &load_locked(const std::string &session_id);
        void retry_load_locked(const std::string &session_id, Entry &entry);
        void mark_dirty_locked(Entry &entry);
        void trim_locked(Entry &entry) const;
        void write_locked(const std::string &session_id, Entry &entry);
        void put_with_quota_locked(const std::string &key, const std::string &payload);
        void evict_largest_locked();

        [[nodiscard]] std::string key_for(const std::string &session_id) const;

        std::shared_ptr<IKeyValueStorage> storage_;
        LocalCacheConfig cfg_;
        NowFn now_;
        bool downgraded_ = false;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace convsync

#endif // CONVSYNC_LOCAL_CACHE_HPP
