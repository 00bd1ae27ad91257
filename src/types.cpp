#include <convsync/types.hpp>

#include <chrono>
#include <variant>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace convsync
{
    namespace
    {
        constexpr std::size_t kPreviewCodePoints = 100;
        constexpr std::size_t kMaxSessionIdLength = 128;

        bool is_continuation_byte(unsigned char c) noexcept
        {
            return (c & 0xC0u) == 0x80u;
        }
    } // namespace

    std::optional<Role> parse_role(std::string_view text) noexcept
    {
        if (text == "user")
            return Role::User;
        if (text == "assistant")
            return Role::Assistant;
        if (text == "system")
            return Role::System;
        return std::nullopt;
    }

    std::string_view to_string(Role role) noexcept
    {
        switch (role)
        {
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::System:
            return "system";
        }
        return "user";
    }

    std::string_view to_string(SyncState state) noexcept
    {
        return state == SyncState::Pending ? "pending" : "confirmed";
    }

    bool is_valid_session_id(std::string_view id) noexcept
    {
        if (id.empty() || id.size() > kMaxSessionIdLength)
            return false;

        for (char ch : id)
        {
            const bool ok = (ch >= 'a' && ch <= 'z') ||
                            (ch >= 'A' && ch <= 'Z') ||
                            (ch >= '0' && ch <= '9') ||
                            ch == '-' || ch == '_' || ch == '.' || ch == ':';
            if (!ok)
                return false;
        }
        return true;
    }

    std::string make_preview(std::string_view content)
    {
        // Walk code points so a multi-byte sequence is never split.
        std::size_t count = 0;
        std::size_t pos = 0;
        while (pos < content.size() && count < kPreviewCodePoints)
        {
            ++pos;
            while (pos < content.size() &&
                   is_continuation_byte(static_cast<unsigned char>(content[pos])))
                ++pos;
            ++count;
        }

        if (pos >= content.size())
            return std::string{content};

        std::string out{content.substr(0, pos)};
        out += "...";
        return out;
    }

    std::string default_session_name(std::string_view sessionId)
    {
        std::string label = "Session ";
        label += sessionId.substr(0, 8);
        return label;
    }

    std::int64_t now_millis()
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string generate_uuid()
    {
        thread_local boost::uuids::random_generator gen;
        return boost::uuids::to_string(gen());
    }

    std::string kvs_get_string(const vix::json::kvs &kv, const std::string &key)
    {
        const auto &a = kv.flat;
        const std::size_t n = a.size() - (a.size() % 2);

        for (std::size_t i = 0; i < n; i += 2)
        {
            const auto &k = a[i].v;
            const auto &v = a[i + 1].v;

            if (std::holds_alternative<std::string>(k) &&
                std::get<std::string>(k) == key)
            {
                if (std::holds_alternative<std::string>(v))
                    return std::get<std::string>(v);
                return {};
            }
        }
        return {};
    }

    void kvs_set_string(vix::json::kvs &kv, const std::string &key, const std::string &value)
    {
        auto &a = kv.flat;
        const std::size_t n = a.size() - (a.size() % 2);

        for (std::size_t i = 0; i < n; i += 2)
        {
            const auto &k = a[i].v;
            if (std::holds_alternative<std::string>(k) &&
                std::get<std::string>(k) == key)
            {
                a[i + 1] = vix::json::token{value};
                return;
            }
        }

        a.resize(n);
        a.emplace_back(vix::json::token{key});
        a.emplace_back(vix::json::token{value});
    }

} // namespace convsync
