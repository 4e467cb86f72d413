#pragma once

#include <ktree/core/types.h>
#include <ktree/graph/side_effects.h>
#include <ktree/model/entry.h>
#include <ktree/storage/entry_store.h>

#include <memory>
#include <string>
#include <vector>

namespace ktree::graph {

/**
 * Maintains mirror links for symmetric relationship kinds.
 *
 * Given relations stored on a source entry, the synchronizer creates (or removes) the matching
 * relation on each target entry. Directional kinds are ignored. Every operation is idempotent
 * and best-effort: a target that cannot be read or written is recorded in the returned
 * SideEffectReport and the remaining relations are still processed.
 */
class LinkSynchronizer {
public:
    explicit LinkSynchronizer(std::shared_ptr<storage::IEntryStore> store);

    // Mirror every symmetric relation of `sourceEntry` onto its target
    SideEffectReport sync(const std::string& sourcePath, const model::Entry& sourceEntry);

    SideEffectReport addMirrors(const std::string& sourcePath,
                                const std::vector<model::Relation>& relations);

    // Drop the relation pointing back at `sourcePath` from every symmetric target
    SideEffectReport removeMirrors(const std::string& sourcePath,
                                   const std::vector<model::Relation>& relations);

    // Single-target primitives; true when the target was rewritten
    Result<bool> addMirror(const std::string& sourcePath, const model::Relation& relation);
    Result<bool> removeMirror(const std::string& sourcePath, const std::string& targetPath);

private:
    std::shared_ptr<storage::IEntryStore> store_;
};

} // namespace ktree::graph
