#include <ktree/app/services/factory.hpp>
#include <ktree/core/time_utils.h>
#include <ktree/graph/link_synchronizer.h>
#include <ktree/graph/reference_rewriter.h>
#include <ktree/graph/traversal_engine.h>
#include <ktree/model/entry_codec.h>
#include <ktree/storage/path_utils.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace ktree::app::services {

namespace {

using json = nlohmann::json;

void appendAll(std::vector<std::string>& out, std::vector<std::string> more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

bool containsEdge(const std::vector<model::Relation>& list, const model::Relation& rel) {
    return std::any_of(list.begin(), list.end(),
                       [&](const model::Relation& r) { return r.sameEdge(rel); });
}

bool hasSymmetricTo(const std::vector<model::Relation>& list, const std::string& target) {
    return std::any_of(list.begin(), list.end(), [&](const model::Relation& r) {
        return r.targetPath == target && model::isSymmetric(r.kind);
    });
}

// "backend/redis/" -> "backend/redis"
std::string normalizePrefix(std::string_view raw) {
    std::string out;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        out.push_back(c == '\\' ? '/'
                                  : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    while (!out.empty() && out.front() == '/') {
        out.erase(out.begin());
    }
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

} // anonymous namespace

class EntryServiceImpl final : public IEntryService {
public:
    explicit EntryServiceImpl(AppContext ctx)
        : ctx_(std::move(ctx)), links_(ctx_.store), references_(ctx_.store),
          traversal_(ctx_.store) {}

    Result<CreateEntryResponse> create(const CreateEntryRequest& req) override {
        auto path = storage::normalizeEntryPath(req.path);
        if (!path) {
            return path.error();
        }
        const auto& key = path.value();

        auto present = ctx_.store->exists(key);
        if (!present) {
            return present.error();
        }
        if (present.value()) {
            return Error{ErrorCode::Conflict, fmt::format("Entry already exists at {}", key)};
        }

        model::Entry entry = req.entry;
        entry.tags = model::normalizeTags(entry.tags);

        std::vector<std::string> problems;
        checkRequiredFields(entry, problems);
        if (auto r = checkRelations(key, entry.relatedTo, {}, problems); !r) {
            return r.error();
        }
        if (!problems.empty()) {
            return Error{ErrorCode::ValidationError,
                         fmt::format("Entry validation failed for {}", key), std::move(problems)};
        }

        auto now = isoTimestampNow();
        if (!entry.createdAt) {
            entry.createdAt = now;
        }
        if (!entry.updatedAt) {
            entry.updatedAt = now;
        }

        if (auto w = ctx_.store->write(key, entry); !w) {
            spdlog::error("Failed to create entry {}: {}", key, w.error().describe());
            return w.error();
        }
        spdlog::debug("Created entry {}", key);

        CreateEntryResponse resp;
        resp.path = key;
        resp.mirrors = links_.sync(key, entry);
        resp.warnings = resp.mirrors.warnings("Mirror link");
        resp.entry = std::move(entry);

        notify(events::EventKind::EntryAdded,
               json{{"path", key}, {"data", model::toJson(resp.entry)}});
        return resp;
    }

    Result<UpdateEntryResponse> update(const UpdateEntryRequest& req) override {
        auto path = storage::normalizeEntryPath(req.path);
        if (!path) {
            return path.error();
        }
        const auto& key = path.value();

        auto present = ctx_.store->exists(key);
        if (!present) {
            return present.error();
        }
        if (!present.value()) {
            return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", key)};
        }
        auto current = ctx_.store->read(key);
        if (!current) {
            return current.error();
        }

        std::optional<std::string> target;
        if (req.newPath) {
            auto normalized = storage::normalizeEntryPath(*req.newPath);
            if (!normalized) {
                return normalized.error();
            }
            if (normalized.value() != key) {
                target = normalized.value();
            }
        }

        if (req.patch.empty() && !target) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Nothing to update for {}: no fields and no new path", key)};
        }

        model::EntryPatch patch = req.patch;
        std::vector<std::string> problems;
        if (patch.title && patch.title->empty()) {
            problems.emplace_back("title must not be empty");
        }
        if (patch.problem && patch.problem->empty()) {
            problems.emplace_back("problem must not be empty");
        }
        if (patch.solution && patch.solution->empty()) {
            problems.emplace_back("solution must not be empty");
        }
        if (patch.relatedTo) {
            if (auto r = checkRelations(key, *patch.relatedTo, current.value().relatedTo, problems);
                !r) {
                return r.error();
            }
        }
        if (!problems.empty()) {
            return Error{ErrorCode::ValidationError,
                         fmt::format("Entry validation failed for {}", key), std::move(problems)};
        }

        // Resolve the destination before any side effect touches another entry
        std::optional<MoveEntryResponse> plan;
        if (target) {
            auto planned = planMove(key, *target);
            if (!planned) {
                return planned.error();
            }
            plan = std::move(planned).value();
        }

        UpdateEntryResponse resp;
        resp.updatedFields = patch.fieldNames();

        model::Entry updated = current.value();
        const auto previousRelations = updated.relatedTo;
        patch.applyTo(updated);
        updated.updatedAt = isoTimestampNow();

        std::vector<model::Relation> added;
        if (patch.relatedTo) {
            std::vector<model::Relation> removed;
            for (const auto& rel : previousRelations) {
                if (model::isSymmetric(rel.kind) && !containsEdge(updated.relatedTo, rel) &&
                    !hasSymmetricTo(updated.relatedTo, rel.targetPath)) {
                    removed.push_back(rel);
                }
            }
            for (const auto& rel : updated.relatedTo) {
                if (model::isSymmetric(rel.kind) && !containsEdge(previousRelations, rel)) {
                    added.push_back(rel);
                }
            }
            // Mirrors still point at the old location until the move rewrites them
            resp.mirrorsRemoved = links_.removeMirrors(key, removed);
            appendAll(resp.warnings, resp.mirrorsRemoved.warnings("Mirror removal"));
        }

        std::string finalPath = key;
        if (plan) {
            auto moved = executeMove(std::move(*plan), &updated);
            if (!moved) {
                return moved.error();
            }
            auto& mv = moved.value();
            finalPath = mv.newPath;
            resp.previousPath = key;
            resp.moved = true;
            resp.references = std::move(mv.references);
            appendAll(resp.warnings, std::move(mv.warnings));
        } else {
            if (auto w = ctx_.store->write(key, updated); !w) {
                spdlog::error("Failed to update entry {}: {}", key, w.error().describe());
                return w.error();
            }
        }

        resp.mirrorsAdded = links_.addMirrors(finalPath, added);
        appendAll(resp.warnings, resp.mirrorsAdded.warnings("Mirror link"));
        resp.path = finalPath;
        resp.entry = std::move(updated);

        spdlog::debug("Updated entry {} ({} fields)", finalPath, resp.updatedFields.size());
        notify(events::EventKind::EntryUpdated,
               json{{"path", finalPath}, {"data", model::toJson(resp.entry)}});
        return resp;
    }

    Result<DeleteEntryResponse> remove(const DeleteEntryRequest& req) override {
        auto path = storage::normalizeEntryPath(req.path);
        if (!path) {
            return path.error();
        }
        const auto& key = path.value();

        auto present = ctx_.store->exists(key);
        if (!present) {
            return present.error();
        }
        if (!present.value()) {
            return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", key)};
        }

        // Best-effort snapshot for the notification payload
        json data;
        if (auto existing = ctx_.store->read(key)) {
            data = model::toJson(existing.value());
        } else {
            spdlog::debug("Deleting unreadable entry {}: {}", key, existing.error().describe());
        }

        if (auto r = ctx_.store->remove(key); !r) {
            return r.error();
        }
        spdlog::debug("Deleted entry {}", key);

        DeleteEntryResponse resp;
        resp.path = key;
        resp.cleanupPerformed = req.cleanupLinks.value_or(ctx_.config.cleanupLinksOnDelete);
        if (resp.cleanupPerformed) {
            resp.references = references_.strip(key);
            resp.referencesRemoved = resp.references.modified;
            resp.warnings = resp.references.warnings("Link cleanup");
        }

        json payload{{"path", key}};
        if (!data.is_null()) {
            payload["data"] = std::move(data);
        }
        notify(events::EventKind::EntryDeleted, payload);
        return resp;
    }

    Result<MoveEntryResponse> move(const MoveEntryRequest& req) override {
        auto from = storage::normalizeEntryPath(req.oldPath);
        if (!from) {
            return from.error();
        }
        auto to = storage::normalizeEntryPath(req.newPath);
        if (!to) {
            return to.error();
        }
        if (from.value() == to.value()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Source and destination are the same: {}", from.value())};
        }
        auto plan = planMove(from.value(), to.value());
        if (!plan) {
            return plan.error();
        }
        return executeMove(std::move(plan).value(), nullptr);
    }

    Result<LinkEntriesResponse> link(const LinkEntriesRequest& req) override {
        auto from = storage::normalizeEntryPath(req.fromPath);
        if (!from) {
            return from.error();
        }
        auto to = storage::normalizeEntryPath(req.toPath);
        if (!to) {
            return to.error();
        }
        const auto& source = from.value();
        const auto& target = to.value();

        auto sourceExists = ctx_.store->exists(source);
        if (!sourceExists) {
            return sourceExists.error();
        }
        if (!sourceExists.value()) {
            return Error{ErrorCode::NotFound, fmt::format("Source entry not found: {}", source)};
        }
        if (source == target) {
            return Error{ErrorCode::ValidationError, "Cannot link an entry to itself",
                         {fmt::format("related_to: {} refers to itself", source)}};
        }
        auto targetExists = ctx_.store->exists(target);
        if (!targetExists) {
            return targetExists.error();
        }
        if (!targetExists.value()) {
            return Error{ErrorCode::ValidationError, "Link target does not exist",
                         {fmt::format("related_to: target does not exist: {}", target)}};
        }

        auto entry = ctx_.store->read(source);
        if (!entry) {
            return entry.error();
        }
        auto& doc = entry.value();

        LinkEntriesResponse resp;
        resp.fromPath = source;
        resp.toPath = target;
        resp.kind = req.kind;

        bool droppedSymmetric = false;
        if (auto* existing = doc.findRelationTo(target)) {
            droppedSymmetric = model::isSymmetric(existing->kind) && !model::isSymmetric(req.kind);
            existing->kind = req.kind;
            if (req.description) {
                existing->description = req.description;
            }
        } else {
            doc.relatedTo.push_back(model::Relation{target, req.kind, req.description});
            resp.created = true;
        }
        doc.updatedAt = isoTimestampNow();

        if (auto w = ctx_.store->write(source, doc); !w) {
            spdlog::error("Failed to link {} -> {}: {}", source, target, w.error().describe());
            return w.error();
        }

        if (droppedSymmetric) {
            if (auto r = links_.removeMirror(source, target); !r) {
                resp.warnings.push_back(fmt::format("Mirror removal failed for {}: {}", target,
                                                    r.error().describe()));
            }
        }
        const auto* stored = doc.findRelationTo(target);
        resp.mirrors = links_.addMirrors(source, {*stored});
        appendAll(resp.warnings, resp.mirrors.warnings("Mirror link"));

        spdlog::debug("Linked {} -[{}]-> {}", source, model::toString(req.kind), target);
        notify(events::EventKind::EntryUpdated,
               json{{"path", source}, {"data", model::toJson(doc)}});
        return resp;
    }

    Result<ReadEntryResponse> read(const ReadEntryRequest& req) override {
        auto path = storage::normalizeEntryPath(req.path);
        if (!path) {
            return path.error();
        }
        int depth = std::clamp(req.depth.value_or(ctx_.config.defaultDepth), 1,
                               std::max(1, ctx_.config.maxDepth));

        auto node = traversal_.readWithDepth(path.value(), depth);
        if (!node) {
            return node.error();
        }
        ReadEntryResponse resp;
        resp.root = std::move(node).value();
        resp.depth = depth;
        return resp;
    }

    Result<ListEntriesResponse> list(const ListEntriesRequest& req) override {
        auto all = ctx_.store->listAll();
        if (!all) {
            return all.error();
        }
        ListEntriesResponse resp;
        auto prefix = normalizePrefix(req.prefix);
        for (auto& p : all.value()) {
            if (storage::isUnderPrefix(p, prefix)) {
                resp.paths.push_back(std::move(p));
            }
        }
        return resp;
    }

private:
    void notify(events::EventKind kind, const json& payload) {
        if (ctx_.notifier) {
            ctx_.notifier->notify(kind, payload);
        }
    }

    static void checkRequiredFields(const model::Entry& entry, std::vector<std::string>& problems) {
        if (!entry.priority) {
            problems.push_back(
                fmt::format("priority is required (one of {})", model::priorityChoices()));
        }
        if (entry.problem.empty()) {
            problems.emplace_back("problem is required and must be non-empty");
        }
        if (entry.solution.empty()) {
            problems.emplace_back("solution is required and must be non-empty");
        }
        if (entry.title && entry.title->empty()) {
            problems.emplace_back("title must not be empty");
        }
    }

    /**
     * Normalizes every relation target in place. Targets of relations not already present in
     * `previous` must exist; self references are rejected. Store failures abort the check.
     */
    Result<void> checkRelations(const std::string& source, std::vector<model::Relation>& relations,
                                const std::vector<model::Relation>& previous,
                                std::vector<std::string>& problems) {
        for (std::size_t i = 0; i < relations.size(); ++i) {
            auto& rel = relations[i];
            auto normalized = storage::normalizeEntryPath(rel.targetPath);
            if (!normalized) {
                problems.push_back(
                    fmt::format("related_to[{}]: {}", i, normalized.error().message));
                continue;
            }
            rel.targetPath = normalized.value();

            if (rel.targetPath == source) {
                problems.push_back(fmt::format("related_to[{}]: {} refers to itself", i, source));
                continue;
            }
            if (containsEdge(previous, rel)) {
                continue;
            }
            auto exists = ctx_.store->exists(rel.targetPath);
            if (!exists) {
                return exists.error();
            }
            if (!exists.value()) {
                problems.push_back(
                    fmt::format("related_to[{}]: target does not exist: {}", i, rel.targetPath));
            }
        }
        return {};
    }

    // Pick a free destination, disambiguating on collision
    Result<std::string> resolveDestination(const std::string& requested,
                                           std::vector<std::string>& warnings) {
        std::string candidate = requested;
        const int maxAttempts = std::max(1, ctx_.config.maxMoveAttempts);
        for (int attempt = 0;; ++attempt) {
            auto taken = ctx_.store->exists(candidate);
            if (!taken) {
                return taken.error();
            }
            if (!taken.value()) {
                break;
            }
            if (attempt >= maxAttempts) {
                return Error{ErrorCode::Conflict,
                             fmt::format("No free destination for {} after {} attempts", requested,
                                         maxAttempts)};
            }
            candidate = storage::disambiguatePath(requested, epochMillisNow() + attempt);
        }
        if (candidate != requested) {
            warnings.push_back(fmt::format("Destination {} already exists; entry moved to {}",
                                           requested, candidate));
        }
        return candidate;
    }

    // Checks the source and picks the destination; writes nothing
    Result<MoveEntryResponse> planMove(const std::string& oldPath, const std::string& requested) {
        auto present = ctx_.store->exists(oldPath);
        if (!present) {
            return present.error();
        }
        if (!present.value()) {
            return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", oldPath)};
        }

        MoveEntryResponse resp;
        resp.oldPath = oldPath;
        resp.requestedPath = requested;

        auto destination = resolveDestination(requested, resp.warnings);
        if (!destination) {
            return destination.error();
        }
        resp.newPath = destination.value();
        resp.conflictResolved = resp.newPath != requested;

        if (auto incoming = references_.countIncoming(oldPath); incoming) {
            resp.incomingReferences = incoming.value();
            if (resp.incomingReferences > 0) {
                resp.warnings.push_back(fmt::format(
                    "{} entries reference {}; their links will be updated to {}",
                    resp.incomingReferences, oldPath, resp.newPath));
            }
        } else {
            spdlog::warn("Could not count references to {}: {}", oldPath,
                         incoming.error().describe());
        }
        return resp;
    }

    /**
     * Carry out a planned move. When `replacement` is set it is written at the new location
     * instead of the stored document.
     */
    Result<MoveEntryResponse> executeMove(MoveEntryResponse resp,
                                          const model::Entry* replacement) {
        const std::string oldPath = resp.oldPath;

        model::Entry entry;
        if (replacement) {
            entry = *replacement;
        } else {
            auto stored = ctx_.store->read(oldPath);
            if (!stored) {
                return stored.error();
            }
            entry = std::move(stored).value();
        }

        if (auto w = ctx_.store->write(resp.newPath, entry); !w) {
            spdlog::error("Failed to write {} while moving {}: {}", resp.newPath, oldPath,
                          w.error().describe());
            return w.error();
        }

        resp.references = references_.rewrite(oldPath, resp.newPath);
        resp.referencesRewritten = resp.references.modified;
        appendAll(resp.warnings, resp.references.warnings("Reference update"));

        if (auto r = ctx_.store->remove(oldPath); !r) {
            spdlog::error("Moved {} to {} but could not remove the original: {}", oldPath,
                          resp.newPath, r.error().describe());
            return Error{r.error().code,
                         fmt::format("Entry copied to {} but {} could not be removed: {}",
                                     resp.newPath, oldPath, r.error().message)};
        }

        spdlog::debug("Moved {} -> {} ({} references rewritten)", oldPath, resp.newPath,
                      resp.referencesRewritten);
        notify(events::EventKind::EntryMoved, json{{"oldPath", oldPath},
                                                    {"newPath", resp.newPath},
                                                    {"data", model::toJson(entry)}});
        return resp;
    }

    AppContext ctx_;
    graph::LinkSynchronizer links_;
    graph::ReferenceRewriter references_;
    graph::TraversalEngine traversal_;
};

std::shared_ptr<IEntryService> makeEntryService(const AppContext& ctx) {
    if (!ctx.store) {
        return nullptr;
    }
    return std::make_shared<EntryServiceImpl>(ctx);
}

} // namespace ktree::app::services
