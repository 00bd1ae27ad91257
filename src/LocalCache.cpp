#include <convsync/LocalCache.hpp>
#include <convsync/errors.hpp>
#include <convsync/protocol.hpp>

#include <algorithm>
#include <iterator>

#include <nlohmann/json.hpp>
#include <vix/utils/Logger.hpp>

namespace convsync
{
    using Logger = vix::utils::Logger;
    static Logger &logger = Logger::getInstance();

    LocalCache::LocalCache(std::shared_ptr<IKeyValueStorage> durable,
                           LocalCacheConfig cfg,
                           NowFn now)
        : storage_(std::move(durable)),
          cfg_(std::move(cfg)),
          now_(std::move(now))
    {
        if (!storage_)
        {
            storage_ = std::make_shared<MemoryKeyValueStorage>();
            downgraded_ = true;
        }
        if (!now_)
            now_ = []
            { return Clock::now(); };
        if (cfg_.capacity == 0)
            cfg_.capacity = 1;
    }

    LocalCache::~LocalCache()
    {
        flush();
    }

    std::string LocalCache::key_for(const std::string &session_id) const
    {
        return cfg_.keyPrefix + session_id;
    }

    // ───────────────────────── Load / trim ─────────────────────────

    bool LocalCache::fetch_locked(const std::string &session_id, std::vector<CachedMessage> &out)
    {
        std::optional<std::string> raw;
        try
        {
            raw = storage_->get(key_for(session_id));
        }
        catch (const StorageUnavailable &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[convsync][Cache] read of {} failed: {}", session_id, e.what());
            return false;
        }

        if (!raw)
            return true;

        auto j = nlohmann::json::parse(*raw, nullptr, /*allow_exceptions=*/false);
        if (!j.is_array())
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Cache] unreadable record for {} ignored", session_id);
            return true;
        }

        std::size_t dropped = 0;
        for (const auto &item : j)
        {
            if (auto m = cached_message_from_json(item))
                out.push_back(std::move(*m));
            else
                ++dropped;
        }

        if (dropped > 0)
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Cache] dropped {} malformed cached entries of {}",
                       dropped, session_id);
        }
        return true;
    }

    LocalCache::Entry &LocalCache::load_locked(const std::string &session_id)
    {
        auto it = entries_.find(session_id);
        if (it != entries_.end())
        {
            if (!it->second.loaded)
                retry_load_locked(session_id, it->second);
            return it->second;
        }

        Entry entry;
        entry.loaded = fetch_locked(session_id, entry.messages);
        trim_locked(entry);
        return entries_.emplace(session_id, std::move(entry)).first->second;
    }

    void LocalCache::retry_load_locked(const std::string &session_id, Entry &entry)
    {
        std::vector<CachedMessage> durable;
        if (!fetch_locked(session_id, durable))
            return;

        // entries added while the durable tier was unreadable go after the stored ones
        durable.insert(durable.end(),
                       std::make_move_iterator(entry.messages.begin()),
                       std::make_move_iterator(entry.messages.end()));
        entry.messages = std::move(durable);
        entry.loaded = true;
        trim_locked(entry);
    }

    void LocalCache::trim_locked(Entry &entry) const
    {
        auto &v = entry.messages;
        if (v.size() > cfg_.capacity)
            v.erase(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(v.size() - cfg_.capacity));
    }

    void LocalCache::mark_dirty_locked(Entry &entry)
    {
        entry.deadline = now_() + cfg_.debounce;
    }

    // ───────────────────────── Reads / writes ─────────────────────────

    std::vector<CachedMessage> LocalCache::read(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return load_locked(session_id).messages;
    }

    std::size_t LocalCache::size(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return load_locked(session_id).messages.size();
    }

    bool LocalCache::dirty(const std::string &session_id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(session_id);
        return it != entries_.end() && it->second.deadline.has_value();
    }

    void LocalCache::append(const std::string &session_id, CachedMessage message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto &entry = load_locked(session_id);
        entry.messages.push_back(std::move(message));
        trim_locked(entry);
        mark_dirty_locked(entry);
    }

    void LocalCache::replace(const std::string &session_id, std::vector<CachedMessage> messages)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto &entry = load_locked(session_id);
        entry.messages = std::move(messages);
        trim_locked(entry);
        mark_dirty_locked(entry);
    }

    void LocalCache::upsert_confirmed(const std::string &session_id, const Message &message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto &entry = load_locked(session_id);
        auto &v = entry.messages;
        const std::string clientId = message.client_id();

        auto it = std::find_if(v.begin(), v.end(),
                               [&](const CachedMessage &c)
                               { return !message.id.empty() && c.id == message.id; });

        if (it == v.end() && !clientId.empty())
        {
            it = std::find_if(v.begin(), v.end(),
                              [&](const CachedMessage &c)
                              { return c.sync_state == SyncState::Pending && c.id == clientId; });
        }

        if (it != v.end())
            *it = as_confirmed(message);
        else
            v.push_back(as_confirmed(message));

        // confirmations of several devices arrive out of timestamp order
        std::stable_sort(v.begin(), v.end(),
                         [](const CachedMessage &a, const CachedMessage &b)
                         { return a.timestamp < b.timestamp; });

        trim_locked(entry);
        mark_dirty_locked(entry);
    }

    std::optional<CachedMessage> LocalCache::latest_confirmed(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto &v = load_locked(session_id).messages;
        for (auto it = v.rbegin(); it != v.rend(); ++it)
        {
            if (it->sync_state == SyncState::Confirmed && !it->id.empty())
                return *it;
        }
        return std::nullopt;
    }

    void LocalCache::reset(const std::string &session_id)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        entries_.erase(session_id);
        entries_.emplace(session_id, Entry{});

        try
        {
            storage_->remove(key_for(session_id));
        }
        catch (const StorageUnavailable &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[convsync][Cache] reset of {} failed: {}", session_id, e.what());
        }
    }

    // ───────────────────────── Durable writes ─────────────────────────

    void LocalCache::tick(Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto &[sid, entry] : entries_)
        {
            if (entry.deadline && *entry.deadline <= now)
                write_locked(sid, entry);
        }
    }

    void LocalCache::flush()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto &[sid, entry] : entries_)
        {
            if (entry.deadline)
                write_locked(sid, entry);
        }
    }

    void LocalCache::write_locked(const std::string &session_id, Entry &entry)
    {
        if (!entry.loaded)
            retry_load_locked(session_id, entry);

        if (!entry.loaded)
        {
            // never overwrite a record that could not be read
            entry.deadline = now_() + cfg_.debounce;
            logger.log(Logger::Level::WARN,
                       "[convsync][Cache] write of {} postponed, stored record unreadable", session_id);
            return;
        }

        nlohmann::json arr = nlohmann::json::array();
        for (const auto &m : entry.messages)
            arr.push_back(cached_message_to_json(m));

        const std::string payload = arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        try
        {
            put_with_quota_locked(key_for(session_id), payload);
            entry.deadline.reset();
        }
        catch (const StorageUnavailable &e)
        {
            // keep the session dirty; the next tick retries
            entry.deadline = now_() + cfg_.debounce;
            logger.log(Logger::Level::ERROR,
                       "[convsync][Cache] write of {} failed: {}", session_id, e.what());
        }
    }

    void LocalCache::put_with_quota_locked(const std::string &key, const std::string &payload)
    {
        try
        {
            storage_->put(key, payload);
            return;
        }
        catch (const QuotaExceeded &e)
        {
            logger.log(Logger::Level::WARN, "[convsync][Cache] {}; evicting largest records", e.what());
        }

        evict_largest_locked();

        try
        {
            storage_->put(key, payload);
            return;
        }
        catch (const QuotaExceeded &e)
        {
            logger.log(Logger::Level::WARN,
                       "[convsync][Cache] still over quota after eviction ({}); using memory tier", e.what());
        }

        storage_ = std::make_shared<MemoryKeyValueStorage>();
        downgraded_ = true;
        storage_->put(key, payload);
    }

    void LocalCache::evict_largest_locked()
    {
        auto records = storage_->entries(cfg_.keyPrefix);

        std::stable_sort(records.begin(), records.end(),
                         [](const auto &a, const auto &b)
                         { return a.second > b.second; });

        const std::size_t n = std::min(cfg_.evictOnQuota, records.size());
        for (std::size_t i = 0; i < n; ++i)
        {
            storage_->remove(records[i].first);
            logger.log(Logger::Level::INFO,
                       "[convsync][Cache] evicted durable record {} ({} bytes)",
                       records[i].first, records[i].second);
        }
    }

    bool LocalCache::persistent() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return !downgraded_ && storage_->persistent();
    }

} // namespace convsync
