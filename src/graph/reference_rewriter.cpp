#include <ktree/graph/reference_rewriter.h>

#include <spdlog/spdlog.h>

namespace ktree::graph {

ReferenceRewriter::ReferenceRewriter(std::shared_ptr<storage::IEntryStore> store)
    : store_(std::move(store)) {}

template <typename Fn>
SideEffectReport ReferenceRewriter::forEachCandidate(
    const std::unordered_set<std::string>& excluded, const char* what, Fn&& mutate) {
    SideEffectReport report;

    auto paths = store_->listAll();
    if (!paths) {
        spdlog::warn("Reference {} skipped, store scan failed: {}", what,
                     paths.error().describe());
        report.fail("*", paths.error());
        return report;
    }

    for (const auto& path : paths.value()) {
        if (excluded.contains(path)) {
            continue;
        }
        report.attempted++;

        auto entry = store_->read(path);
        if (!entry) {
            if (entry.error().code != ErrorCode::NotFound) {
                spdlog::warn("Reference {} skipped {}: {}", what, path,
                             entry.error().describe());
                report.fail(path, entry.error());
            }
            // Removed since the scan started
            continue;
        }

        if (!mutate(entry.value())) {
            continue;
        }
        if (auto w = store_->write(path, entry.value()); !w) {
            spdlog::warn("Reference {} could not write {}: {}", what, path,
                         w.error().describe());
            report.fail(path, w.error());
            continue;
        }
        report.modified++;
    }
    return report;
}

SideEffectReport ReferenceRewriter::rewrite(const std::string& oldPath,
                                            const std::string& newPath) {
    auto report = forEachCandidate({oldPath, newPath}, "rewrite", [&](model::Entry& entry) {
        bool changed = false;
        for (auto& rel : entry.relatedTo) {
            if (rel.targetPath == oldPath) {
                rel.targetPath = newPath;
                changed = true;
            }
        }
        return changed;
    });
    spdlog::debug("Rewrote references {} -> {} in {} entries", oldPath, newPath, report.modified);
    return report;
}

SideEffectReport ReferenceRewriter::strip(const std::string& deadPath) {
    auto report = forEachCandidate({deadPath}, "cleanup", [&](model::Entry& entry) {
        return entry.removeRelationsTo(deadPath) > 0;
    });
    spdlog::debug("Removed references to {} from {} entries", deadPath, report.modified);
    return report;
}

Result<std::size_t> ReferenceRewriter::countIncoming(const std::string& path) const {
    auto paths = store_->listAll();
    if (!paths) {
        return paths.error();
    }
    std::size_t count = 0;
    for (const auto& candidate : paths.value()) {
        if (candidate == path) {
            continue;
        }
        auto entry = store_->read(candidate);
        if (!entry) {
            spdlog::debug("Skipping {} while counting references: {}", candidate,
                          entry.error().describe());
            continue;
        }
        if (entry.value().hasRelationTo(path)) {
            ++count;
        }
    }
    return count;
}

} // namespace ktree::graph
