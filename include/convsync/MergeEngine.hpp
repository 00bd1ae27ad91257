#ifndef CONVSYNC_MERGE_ENGINE_HPP
#define CONVSYNC_MERGE_ENGINE_HPP

/**
 * @file MergeEngine.hpp
 * @brief Reconcile the local cache with a gateway response.
 */

#include <vector>

#include <convsync/types.hpp>

namespace convsync
{
    /**
     * @brief Merge cached entries with the server's answer.
     *
     * Local entries are inserted first, then remote ones. A remote entry
     * overwrites the local entry with the same id and keeps its position.
     * Local entries without an id are always kept; remote ones are
     * skipped. Local pending entries whose
     * provisional id is the `client_id` of a remote entry are dropped
     * beforehand. The result is stable-sorted by timestamp.
     */
    [[nodiscard]] std::vector<CachedMessage> merge(const std::vector<CachedMessage> &local,
                                                   const std::vector<CachedMessage> &remote);

} // namespace convsync

#endif // CONVSYNC_MERGE_ENGINE_HPP
