#include <ktree/app/services/factory.hpp>
#include <ktree/graph/link_synchronizer.h>
#include <ktree/storage/path_utils.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ktree::app::services {

std::string_view toString(IssueKind kind) noexcept {
    switch (kind) {
        case IssueKind::Unreadable:
            return "unreadable";
        case IssueKind::BrokenLink:
            return "broken_link";
        case IssueKind::MissingMirror:
            return "missing_mirror";
    }
    return "unreadable";
}

class ValidationServiceImpl final : public IValidationService {
public:
    explicit ValidationServiceImpl(AppContext ctx) : ctx_(std::move(ctx)), links_(ctx_.store) {}

    Result<ValidateResponse> validate(const ValidateRequest& req) override {
        std::vector<std::string> paths;
        if (req.path) {
            auto key = storage::normalizeEntryPath(*req.path);
            if (!key) {
                return key.error();
            }
            auto present = ctx_.store->exists(key.value());
            if (!present) {
                return present.error();
            }
            if (!present.value()) {
                return Error{ErrorCode::NotFound, fmt::format("Entry not found: {}", key.value())};
            }
            paths.push_back(key.value());
        } else {
            auto all = ctx_.store->listAll();
            if (!all) {
                return all.error();
            }
            paths = std::move(all).value();
        }

        ValidateResponse resp;
        for (const auto& path : paths) {
            if (auto r = checkEntry(path, req.fix, resp); !r) {
                return r.error();
            }
        }

        spdlog::debug("Validated {} entries: {} issues, {} fixed", resp.checked,
                      resp.issues.size(), resp.fixed);
        return resp;
    }

private:
    Result<void> checkEntry(const std::string& path, bool fix, ValidateResponse& resp) {
        resp.checked++;
        auto entry = ctx_.store->read(path);
        if (!entry) {
            if (entry.error().code == ErrorCode::NotFound) {
                // Removed since the scan started
                return {};
            }
            resp.issues.push_back({IssueKind::Unreadable, path, "", std::nullopt,
                                   entry.error().describe(), false});
            return {};
        }

        for (const auto& rel : entry.value().relatedTo) {
            auto targetExists = ctx_.store->exists(rel.targetPath);
            if (!targetExists) {
                return targetExists.error();
            }
            if (!targetExists.value()) {
                resp.issues.push_back(
                    {IssueKind::BrokenLink, path, rel.targetPath, rel.kind,
                     fmt::format("{} links to missing entry {}", path, rel.targetPath), false});
                continue;
            }
            if (!model::isSymmetric(rel.kind) || rel.targetPath == path) {
                continue;
            }

            auto target = ctx_.store->read(rel.targetPath);
            if (!target) {
                // Reported when the target itself is checked
                spdlog::debug("Skipping mirror check {} -> {}: {}", path, rel.targetPath,
                              target.error().describe());
                continue;
            }
            if (target.value().hasRelationTo(path)) {
                continue;
            }

            ValidationIssue issue{IssueKind::MissingMirror, path, rel.targetPath, rel.kind,
                                  fmt::format("{} has no {} link back to {}", rel.targetPath,
                                              model::toString(rel.kind), path),
                                  false};
            if (fix) {
                auto repaired = links_.addMirror(path, rel);
                if (repaired && repaired.value()) {
                    issue.fixed = true;
                    resp.fixed++;
                } else if (!repaired) {
                    spdlog::warn("Could not repair mirror on {}: {}", rel.targetPath,
                                 repaired.error().describe());
                    issue.message += fmt::format(" (repair failed: {})",
                                                 repaired.error().describe());
                }
            }
            resp.issues.push_back(std::move(issue));
        }
        return {};
    }

    AppContext ctx_;
    graph::LinkSynchronizer links_;
};

std::shared_ptr<IValidationService> makeValidationService(const AppContext& ctx) {
    if (!ctx.store) {
        return nullptr;
    }
    return std::make_shared<ValidationServiceImpl>(ctx);
}

} // namespace ktree::app::services
