#pragma once

#include <ktree/core/types.h>
#include <ktree/graph/side_effects.h>
#include <ktree/storage/entry_store.h>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>

namespace ktree::graph {

/**
 * Store-wide scan over incoming references.
 *
 * Every mode walks IEntryStore::listAll() and reads each candidate; the scan is not
 * snapshot-isolated against concurrent writers. A candidate that cannot be read, decoded or
 * written is skipped and recorded in the report; the scan always runs to the end.
 */
class ReferenceRewriter {
public:
    explicit ReferenceRewriter(std::shared_ptr<storage::IEntryStore> store);

    // Retarget every relation pointing at `oldPath` to `newPath`. Both paths are excluded
    // from the scan.
    SideEffectReport rewrite(const std::string& oldPath, const std::string& newPath);

    // Remove every relation pointing at `deadPath`
    SideEffectReport strip(const std::string& deadPath);

    // Number of entries holding at least one relation to `path`
    Result<std::size_t> countIncoming(const std::string& path) const;

private:
    template <typename Fn>
    SideEffectReport forEachCandidate(const std::unordered_set<std::string>& excluded,
                                      const char* what, Fn&& mutate);

    std::shared_ptr<storage::IEntryStore> store_;
};

} // namespace ktree::graph
