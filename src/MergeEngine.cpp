#include <convsync/MergeEngine.hpp>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace convsync
{
    std::vector<CachedMessage> merge(const std::vector<CachedMessage> &local,
                                     const std::vector<CachedMessage> &remote)
    {
        std::unordered_set<std::string> confirmedClientIds;
        for (const auto &r : remote)
        {
            std::string cid = r.client_id();
            if (!cid.empty())
                confirmedClientIds.insert(std::move(cid));
        }

        std::vector<CachedMessage> out;
        out.reserve(local.size() + remote.size());
        std::unordered_map<std::string, std::size_t> index;

        auto insert = [&](const CachedMessage &m)
        {
            if (m.id.empty())
            {
                out.push_back(m);
                return;
            }

            auto it = index.find(m.id);
            if (it != index.end())
            {
                out[it->second] = m;
                return;
            }

            index.emplace(m.id, out.size());
            out.push_back(m);
        };

        for (const auto &l : local)
        {
            if (l.sync_state == SyncState::Pending &&
                (confirmedClientIds.count(l.id) != 0 ||
                 confirmedClientIds.count(l.client_id()) != 0))
            {
                continue;
            }
            insert(l);
        }

        // a server entry without an id cannot be matched on the next merge
        for (const auto &r : remote)
        {
            if (!r.id.empty())
                insert(r);
        }

        std::stable_sort(out.begin(), out.end(),
                         [](const CachedMessage &a, const CachedMessage &b)
                         { return a.timestamp < b.timestamp; });

        return out;
    }

} // namespace convsync
