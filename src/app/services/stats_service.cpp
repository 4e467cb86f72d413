#include <ktree/app/services/factory.hpp>
#include <ktree/core/time_utils.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <unordered_map>

namespace ktree::app::services {

std::string_view toString(ChangeType type) noexcept {
    return type == ChangeType::Added ? "added" : "modified";
}

std::optional<ChangeType> parseChangeType(std::string_view name) noexcept {
    if (name == "added") {
        return ChangeType::Added;
    }
    if (name == "modified") {
        return ChangeType::Modified;
    }
    return std::nullopt;
}

namespace {

struct LoadedEntry {
    std::string path;
    model::Entry entry;
};

// First path segment, "root" for entries at the top of the store
std::string categoryOf(const std::string& path) {
    auto slash = path.find('/');
    return slash == std::string::npos ? std::string("root") : path.substr(0, slash);
}

// Second path segment, present only for entries nested at least two levels deep
std::optional<std::string> subcategoryOf(const std::string& path) {
    auto first = path.find('/');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto second = path.find('/', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }
    return path.substr(first + 1, second - first - 1);
}

} // namespace

class StatsServiceImpl final : public IStatsService {
public:
    explicit StatsServiceImpl(AppContext ctx) : ctx_(std::move(ctx)) {}

    Result<StatsResponse> getStats(const StatsRequest& req) override {
        std::size_t unreadable = 0;
        auto loaded = loadAll(unreadable);
        if (!loaded) {
            return loaded.error();
        }
        const auto& entries = loaded.value();

        StatsResponse resp;
        resp.totalEntries = entries.size();
        resp.unreadable = unreadable;

        std::unordered_map<std::string, std::size_t> byPriority;
        std::unordered_map<std::string, std::size_t> incoming;
        std::unordered_map<std::string, bool> present;
        for (const auto& item : entries) {
            present[item.path] = true;
        }

        for (const auto& [path, entry] : entries) {
            if (!entry.examples.empty() || (entry.code && !entry.code->empty())) {
                resp.withCode++;
            }
            if (entry.relatedTo.empty()) {
                resp.orphaned.push_back(path);
            } else {
                resp.withRelationships++;
                resp.totalRelationships += entry.relatedTo.size();
            }
            for (const auto& rel : entry.relatedTo) {
                incoming[rel.targetPath]++;
            }

            auto& category = resp.categories[categoryOf(path)];
            category.count++;
            if (entry.priority) {
                auto name = std::string(model::toString(*entry.priority));
                byPriority[name]++;
                category.priorities[name]++;
            }
            if (auto sub = subcategoryOf(path)) {
                category.subcategories.insert(*sub);
            }
        }

        for (auto priority : model::kAllPriorities) {
            auto it = byPriority.find(std::string(model::toString(priority)));
            resp.priorities.emplace_back(priority, it == byPriority.end() ? 0 : it->second);
        }
        std::stable_sort(resp.priorities.begin(), resp.priorities.end(),
                         [](const auto& a, const auto& b) {
                             return model::priorityWeight(a.first) >
                                    model::priorityWeight(b.first);
                         });

        for (const auto& [target, count] : incoming) {
            resp.mostLinked.push_back({target, count, present.count(target) > 0});
        }
        std::sort(resp.mostLinked.begin(), resp.mostLinked.end(),
                  [](const LinkedCount& a, const LinkedCount& b) {
                      if (a.incomingLinks != b.incomingLinks) {
                          return a.incomingLinks > b.incomingLinks;
                      }
                      return a.path < b.path;
                  });
        if (resp.mostLinked.size() > req.topLinked) {
            resp.mostLinked.resize(req.topLinked);
        }

        if (resp.totalEntries > 0) {
            resp.averageLinks = static_cast<double>(resp.totalRelationships) /
                                static_cast<double>(resp.totalEntries);
        }

        spdlog::debug("Stats over {} entries: {} relations, {} orphaned, {} unreadable",
                      resp.totalEntries, resp.totalRelationships, resp.orphaned.size(),
                      resp.unreadable);
        return resp;
    }

    Result<RecentResponse> recent(const RecentRequest& req) override {
        if (req.days < 1) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("days must be at least 1, got {}", req.days)};
        }

        auto now = std::chrono::system_clock::now();
        RecentResponse resp;
        resp.to = formatIso8601(now);
        resp.from = formatIso8601(now - std::chrono::hours(24) * req.days);

        std::size_t unreadable = 0;
        auto loaded = loadAll(unreadable);
        if (!loaded) {
            return loaded.error();
        }

        std::vector<RecentEntry> changes;
        for (const auto& [path, entry] : loaded.value()) {
            const auto created = entry.createdAt.value_or("");
            const auto updated = entry.updatedAt.value_or(created);
            if (updated.empty()) {
                continue;
            }

            // ISO-8601 UTC stamps of a fixed layout order lexicographically
            RecentEntry change;
            if (!created.empty() && created >= resp.from) {
                change.change = ChangeType::Added;
            } else if (updated >= resp.from) {
                change.change = ChangeType::Modified;
            } else {
                continue;
            }
            if (req.type && *req.type != change.change) {
                continue;
            }

            change.path = path;
            change.priority = entry.priority;
            change.createdAt = created;
            change.updatedAt = updated;
            change.relationships = entry.relatedTo.size();
            if (change.change == ChangeType::Added) {
                resp.added++;
            } else {
                resp.modified++;
            }
            changes.push_back(std::move(change));
        }

        std::sort(changes.begin(), changes.end(), [](const RecentEntry& a, const RecentEntry& b) {
            if (a.updatedAt != b.updatedAt) {
                return a.updatedAt > b.updatedAt;
            }
            return a.path < b.path;
        });
        resp.totalChanges = changes.size();
        if (changes.size() > req.limit) {
            changes.resize(req.limit);
        }
        resp.entries = std::move(changes);
        return resp;
    }

private:
    // Every readable entry; unreadable ones are counted and skipped
    Result<std::vector<LoadedEntry>> loadAll(std::size_t& unreadable) const {
        auto paths = ctx_.store->listAll();
        if (!paths) {
            return paths.error();
        }

        std::vector<LoadedEntry> entries;
        entries.reserve(paths.value().size());
        for (const auto& path : paths.value()) {
            auto entry = ctx_.store->read(path);
            if (!entry) {
                if (entry.error().code != ErrorCode::NotFound) {
                    spdlog::debug("Skipping {}: {}", path, entry.error().describe());
                    unreadable++;
                }
                continue;
            }
            entries.push_back({path, std::move(entry).value()});
        }
        return entries;
    }

    AppContext ctx_;
};

std::shared_ptr<IStatsService> makeStatsService(const AppContext& ctx) {
    return std::make_shared<StatsServiceImpl>(ctx);
}

} // namespace ktree::app::services
