#ifndef CONVSYNC_TEST_SUPPORT_HPP
#define CONVSYNC_TEST_SUPPORT_HPP

/**
 * @file test_support.hpp
 * @brief In-memory doubles shared by the unit tests.
 */

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <convsync/ConnectionManager.hpp>
#include <convsync/KeyValueStorage.hpp>
#include <convsync/SyncGateway.hpp>
#include <convsync/errors.hpp>
#include <convsync/timer.hpp>

namespace convsync::test
{
    /// Single-slot timer driven by the test: fire() runs the armed callback.
    class ManualTimer : public ITimer
    {
    public:
        void arm(std::chrono::milliseconds delay, std::function<void()> callback) override
        {
            delay_ = delay;
            callback_ = std::move(callback);
            ++armCount_;
        }

        void cancel() override
        {
            callback_ = nullptr;
            delay_.reset();
        }

        [[nodiscard]] bool armed() const { return static_cast<bool>(callback_); }
        [[nodiscard]] std::optional<std::chrono::milliseconds> delay() const { return delay_; }
        [[nodiscard]] int arm_count() const { return armCount_; }

        /// Run the armed callback once (it may re-arm).
        bool fire()
        {
            if (!callback_)
                return false;
            auto cb = std::move(callback_);
            callback_ = nullptr;
            delay_.reset();
            cb();
            return true;
        }

    private:
        std::function<void()> callback_;
        std::optional<std::chrono::milliseconds> delay_;
        int armCount_ = 0;
    };

    /// Records everything the ConnectionManager asks of the transport.
    class FakeTransport : public ITransport
    {
    public:
        void open(std::uint64_t epoch) override { opened.push_back(epoch); }
        void close() override { ++closes; }
        void send_text(const std::string &text) override { sent.push_back(text); }

        std::vector<std::uint64_t> opened;
        std::vector<std::string> sent;
        int closes = 0;
    };

    /// Gateway-side channel that keeps the frames sent to it.
    class FakeChannel : public IChannel
    {
    public:
        explicit FakeChannel(std::string sessionId) : sessionId_(std::move(sessionId)) {}

        const std::string &session_id() const override { return sessionId_; }
        void send_text(std::string_view text) override { frames.emplace_back(text); }

        std::vector<std::string> frames;

    private:
        std::string sessionId_;
    };

    /// Key/value tier with a byte quota, for cache quota handling.
    class QuotaStorage : public IKeyValueStorage
    {
    public:
        explicit QuotaStorage(std::size_t quota) : quota_(quota) {}

        std::optional<std::string> get(const std::string &key) override
        {
            if (failReads)
                throw StorageUnavailable("read failed");
            auto it = records.find(key);
            if (it == records.end())
                return std::nullopt;
            return it->second;
        }

        void put(const std::string &key, const std::string &value) override
        {
            ++puts;
            std::size_t used = value.size();
            for (const auto &[k, v] : records)
            {
                if (k != key)
                    used += v.size();
            }
            if (used > quota_)
                throw QuotaExceeded("quota exceeded");
            records[key] = value;
        }

        void remove(const std::string &key) override { records.erase(key); }

        std::vector<std::pair<std::string, std::size_t>> entries(const std::string &prefix) override
        {
            std::vector<std::pair<std::string, std::size_t>> out;
            for (const auto &[k, v] : records)
            {
                if (k.compare(0, prefix.size(), prefix) == 0)
                    out.emplace_back(k, v.size());
            }
            return out;
        }

        bool persistent() const noexcept override { return true; }

        std::map<std::string, std::string> records;
        int puts = 0;
        bool failReads = false;

    private:
        std::size_t quota_;
    };

    inline CachedMessage cached(std::string id,
                                std::int64_t timestamp,
                                SyncState state = SyncState::Confirmed,
                                std::string content = "text")
    {
        CachedMessage m;
        m.id = std::move(id);
        m.session_id = "s1";
        m.role = Role::User;
        m.content = std::move(content);
        m.timestamp = timestamp;
        m.sync_state = state;
        return m;
    }

} // namespace convsync::test

#endif // CONVSYNC_TEST_SUPPORT_HPP
