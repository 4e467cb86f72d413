#include <ktree/graph/link_synchronizer.h>

#include <spdlog/spdlog.h>

namespace ktree::graph {

LinkSynchronizer::LinkSynchronizer(std::shared_ptr<storage::IEntryStore> store)
    : store_(std::move(store)) {}

SideEffectReport LinkSynchronizer::sync(const std::string& sourcePath,
                                        const model::Entry& sourceEntry) {
    return addMirrors(sourcePath, sourceEntry.relatedTo);
}

Result<bool> LinkSynchronizer::addMirror(const std::string& sourcePath,
                                         const model::Relation& relation) {
    auto target = store_->read(relation.targetPath);
    if (!target) {
        return target.error();
    }
    auto& entry = target.value();
    if (entry.hasRelationTo(sourcePath)) {
        return false;
    }

    entry.relatedTo.push_back(
        model::Relation{sourcePath, relation.kind, relation.description});
    if (auto w = store_->write(relation.targetPath, entry); !w) {
        return w.error();
    }
    spdlog::debug("Mirrored {} {} -> {}", model::toString(relation.kind), relation.targetPath,
                  sourcePath);
    return true;
}

Result<bool> LinkSynchronizer::removeMirror(const std::string& sourcePath,
                                            const std::string& targetPath) {
    auto target = store_->read(targetPath);
    if (!target) {
        return target.error();
    }
    auto& entry = target.value();
    if (entry.removeRelationsTo(sourcePath) == 0) {
        return false;
    }
    if (auto w = store_->write(targetPath, entry); !w) {
        return w.error();
    }
    spdlog::debug("Removed mirror {} -> {}", targetPath, sourcePath);
    return true;
}

SideEffectReport LinkSynchronizer::addMirrors(const std::string& sourcePath,
                                              const std::vector<model::Relation>& relations) {
    SideEffectReport report;
    for (const auto& rel : relations) {
        if (!model::isSymmetric(rel.kind) || rel.targetPath == sourcePath) {
            continue;
        }
        report.attempted++;
        auto r = addMirror(sourcePath, rel);
        if (!r) {
            spdlog::warn("Could not create mirror link on {} for {}: {}", rel.targetPath,
                         sourcePath, r.error().describe());
            report.fail(rel.targetPath, r.error());
            continue;
        }
        if (r.value()) {
            report.modified++;
        }
    }
    return report;
}

SideEffectReport LinkSynchronizer::removeMirrors(const std::string& sourcePath,
                                                 const std::vector<model::Relation>& relations) {
    SideEffectReport report;
    for (const auto& rel : relations) {
        if (!model::isSymmetric(rel.kind) || rel.targetPath == sourcePath) {
            continue;
        }
        report.attempted++;
        auto r = removeMirror(sourcePath, rel.targetPath);
        if (!r) {
            spdlog::warn("Could not remove mirror link on {} for {}: {}", rel.targetPath,
                         sourcePath, r.error().describe());
            report.fail(rel.targetPath, r.error());
            continue;
        }
        if (r.value()) {
            report.modified++;
        }
    }
    return report;
}

} // namespace ktree::graph
