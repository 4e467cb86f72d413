#include <ktree/graph/traversal_engine.h>
#include <ktree/model/entry_codec.h>

#include <spdlog/spdlog.h>

namespace ktree::graph {

using json = nlohmann::json;

TraversalEngine::TraversalEngine(std::shared_ptr<storage::IEntryStore> store)
    : store_(std::move(store)) {}

Result<TraversalNode> TraversalEngine::readWithDepth(
    const std::string& path, int depth, std::unordered_set<std::string> visited) const {
    TraversalNode node;
    node.path = path;

    if (visited.contains(path)) {
        spdlog::debug("Circular reference at {}", path);
        node.circular = true;
        return node;
    }
    visited.insert(path);

    auto entry = store_->read(path);
    if (!entry) {
        return entry.error();
    }
    node.entry = std::move(entry).value();

    const auto& relations = node.entry->relatedTo;
    if (depth <= 1 || relations.empty()) {
        return node;
    }

    std::vector<LinkedEntry> linked;
    linked.reserve(relations.size());
    for (const auto& rel : relations) {
        LinkedEntry link;
        link.targetPath = rel.targetPath;
        link.relationship = rel.kind;
        link.description = rel.description;

        // Each branch gets its own copy of the ancestors
        auto child = readWithDepth(rel.targetPath, depth - 1, visited);
        if (child) {
            link.content = std::make_shared<const TraversalNode>(std::move(child).value());
        } else {
            spdlog::debug("Linked entry {} from {} unavailable: {}", rel.targetPath, path,
                          child.error().describe());
            link.error = "Failed to load linked entry: " + child.error().describe();
        }
        linked.push_back(std::move(link));
    }
    node.linked = std::move(linked);
    return node;
}

json toJson(const TraversalNode& node) {
    if (node.circular) {
        return json{{"circular_reference", node.path}};
    }

    json j = json::object();
    j["path"] = node.path;
    if (node.entry) {
        j.update(model::toJson(*node.entry));
    }
    if (node.linked) {
        json links = json::object();
        for (const auto& link : *node.linked) {
            json item;
            item["relationship"] = std::string(model::toString(link.relationship));
            if (link.description) {
                item["description"] = *link.description;
            }
            if (link.content) {
                item["content"] = toJson(*link.content);
            } else {
                item["error"] = link.error.value_or("Failed to load linked entry");
            }
            links[link.targetPath] = std::move(item);
        }
        j["linked_entries"] = std::move(links);
    }
    return j;
}

std::size_t countResolved(const TraversalNode& node) {
    if (node.circular) {
        return 0;
    }
    std::size_t total = 1;
    if (node.linked) {
        for (const auto& link : *node.linked) {
            if (link.content) {
                total += countResolved(*link.content);
            }
        }
    }
    return total;
}

} // namespace ktree::graph
