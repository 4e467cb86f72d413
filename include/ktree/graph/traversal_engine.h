#pragma once

#include <ktree/core/types.h>
#include <ktree/model/entry.h>
#include <ktree/storage/entry_store.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ktree::graph {

struct TraversalNode;

// One expanded relation of a traversed entry: either content or an error, never both
struct LinkedEntry {
    std::string targetPath;
    model::RelationshipKind relationship = model::RelationshipKind::Related;
    std::optional<std::string> description;
    std::shared_ptr<const TraversalNode> content;
    std::optional<std::string> error;
};

/**
 * Result of a depth-limited read. A circular node only carries its path. `linked` is absent
 * (not empty) when the depth budget was exhausted or the entry has no relations.
 */
struct TraversalNode {
    std::string path;
    bool circular = false;
    std::optional<model::Entry> entry;
    std::optional<std::vector<LinkedEntry>> linked;
};

/**
 * {"circular_reference": path} for circular nodes, otherwise
 * {"path": ..., <entry fields>, "linked_entries": {target: {relationship, description,
 * content | error}}}.
 */
nlohmann::json toJson(const TraversalNode& node);

// Nodes in the expanded tree, circular markers and failed links excluded
std::size_t countResolved(const TraversalNode& node);

/**
 * Cycle-safe, depth-bounded graph walk. The visited set is copied for every recursion so
 * sibling branches never suppress each other; only ancestors on the current branch produce a
 * circular marker.
 */
class TraversalEngine {
public:
    explicit TraversalEngine(std::shared_ptr<storage::IEntryStore> store);

    // Failure to read the root propagates (NotFound / Malformed); failures below it are
    // embedded as LinkedEntry::error.
    Result<TraversalNode> readWithDepth(const std::string& path, int depth,
                                        std::unordered_set<std::string> visited = {}) const;

private:
    std::shared_ptr<storage::IEntryStore> store_;
};

} // namespace ktree::graph
