#pragma once

// Entry graph services shared by the CLI and any other front-end. Every mutation goes through
// IEntryService so the mirror and reference bookkeeping cannot drift between callers.

#include <ktree/config/engine_config.h>
#include <ktree/core/types.h>
#include <ktree/events/change_notifier.h>
#include <ktree/graph/side_effects.h>
#include <ktree/graph/traversal_engine.h>
#include <ktree/model/entry.h>
#include <ktree/storage/entry_store.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ktree::app::services {

struct AppContext {
    std::shared_ptr<storage::IEntryStore> store;
    std::shared_ptr<events::INotificationSink> notifier; // optional
    config::EngineConfig config;
};

// ===========================
// Entry Service
// ===========================

struct CreateEntryRequest {
    std::string path;
    model::Entry entry;
};

struct CreateEntryResponse {
    std::string path;
    model::Entry entry; // as written, timestamps included
    graph::SideEffectReport mirrors;
    std::vector<std::string> warnings;
};

struct UpdateEntryRequest {
    std::string path;
    model::EntryPatch patch;
    std::optional<std::string> newPath; // relocate as part of the update
};

struct UpdateEntryResponse {
    std::string path; // final location
    std::optional<std::string> previousPath;
    bool moved{false};
    std::vector<std::string> updatedFields;
    model::Entry entry;
    graph::SideEffectReport mirrorsRemoved;
    graph::SideEffectReport mirrorsAdded;
    graph::SideEffectReport references; // only populated when moved
    std::vector<std::string> warnings;
};

struct DeleteEntryRequest {
    std::string path;
    std::optional<bool> cleanupLinks; // defaults to EngineConfig::cleanupLinksOnDelete
};

struct DeleteEntryResponse {
    std::string path;
    bool cleanupPerformed{false};
    std::size_t referencesRemoved{0};
    graph::SideEffectReport references;
    std::vector<std::string> warnings;
};

struct MoveEntryRequest {
    std::string oldPath;
    std::string newPath;
};

struct MoveEntryResponse {
    std::string oldPath;
    std::string requestedPath;
    std::string newPath; // where the entry actually landed
    bool conflictResolved{false};
    std::size_t incomingReferences{0};
    std::size_t referencesRewritten{0};
    graph::SideEffectReport references;
    std::vector<std::string> warnings;
};

struct LinkEntriesRequest {
    std::string fromPath;
    std::string toPath;
    model::RelationshipKind kind{model::RelationshipKind::Related};
    std::optional<std::string> description;
};

struct LinkEntriesResponse {
    std::string fromPath;
    std::string toPath;
    model::RelationshipKind kind{model::RelationshipKind::Related};
    bool created{false}; // false when an existing relation was updated in place
    graph::SideEffectReport mirrors;
    std::vector<std::string> warnings;
};

struct ReadEntryRequest {
    std::string path;
    std::optional<int> depth; // defaults to EngineConfig::defaultDepth
};

struct ReadEntryResponse {
    graph::TraversalNode root;
    int depth{1};
};

struct ListEntriesRequest {
    std::string prefix; // directory, e.g. "backend/redis"
};

struct ListEntriesResponse {
    std::vector<std::string> paths;
};

class IEntryService {
public:
    virtual ~IEntryService() = default;

    virtual Result<CreateEntryResponse> create(const CreateEntryRequest& req) = 0;
    virtual Result<UpdateEntryResponse> update(const UpdateEntryRequest& req) = 0;
    virtual Result<DeleteEntryResponse> remove(const DeleteEntryRequest& req) = 0;
    virtual Result<MoveEntryResponse> move(const MoveEntryRequest& req) = 0;
    virtual Result<LinkEntriesResponse> link(const LinkEntriesRequest& req) = 0;

    virtual Result<ReadEntryResponse> read(const ReadEntryRequest& req) = 0;
    virtual Result<ListEntriesResponse> list(const ListEntriesRequest& req) = 0;
};

// ===========================
// Validation Service
// ===========================

enum class IssueKind {
    Unreadable,    // document cannot be read or decoded
    BrokenLink,    // relation target does not exist
    MissingMirror, // symmetric relation without its reverse
};

std::string_view toString(IssueKind kind) noexcept;

struct ValidationIssue {
    IssueKind kind{IssueKind::Unreadable};
    std::string path;
    std::string targetPath;
    std::optional<model::RelationshipKind> relationship;
    std::string message;
    bool fixed{false};
};

struct ValidateRequest {
    std::optional<std::string> path; // whole store when absent
    bool fix{false};                 // add missing mirrors
};

struct ValidateResponse {
    std::size_t checked{0};
    std::vector<ValidationIssue> issues;
    std::size_t fixed{0};
};

class IValidationService {
public:
    virtual ~IValidationService() = default;
    virtual Result<ValidateResponse> validate(const ValidateRequest& req) = 0;
};

// ===========================
// Stats Service
// ===========================

struct StatsRequest {
    std::size_t topLinked{10}; // length of the most-linked list
};

struct CategoryStats {
    std::size_t count{0};
    std::map<std::string, std::size_t> priorities;
    std::set<std::string> subcategories;
};

struct LinkedCount {
    std::string path;
    std::size_t incomingLinks{0};
    bool exists{true}; // false for targets of broken links
};

struct StatsResponse {
    std::size_t totalEntries{0}; // readable entries
    std::size_t unreadable{0};
    std::size_t withCode{0}; // code or at least one example
    std::size_t withRelationships{0};
    std::size_t totalRelationships{0};
    // Every priority, highest weight first
    std::vector<std::pair<model::Priority, std::size_t>> priorities;
    // Keyed by first path segment; "root" for top-level entries
    std::map<std::string, CategoryStats> categories;
    std::vector<std::string> orphaned; // entries without relations
    std::vector<LinkedCount> mostLinked;
    double averageLinks{0.0};
};

enum class ChangeType { Added, Modified };

std::string_view toString(ChangeType type) noexcept;
std::optional<ChangeType> parseChangeType(std::string_view name) noexcept;

struct RecentRequest {
    int days{7};
    std::size_t limit{20};
    std::optional<ChangeType> type; // both kinds when absent
};

struct RecentEntry {
    std::string path;
    ChangeType change{ChangeType::Added};
    std::optional<model::Priority> priority;
    std::string createdAt;
    std::string updatedAt;
    std::size_t relationships{0};
};

struct RecentResponse {
    std::string from; // cutoff timestamp
    std::string to;
    std::size_t totalChanges{0};
    std::size_t added{0};
    std::size_t modified{0};
    std::vector<RecentEntry> entries; // newest first, at most `limit`
};

class IStatsService {
public:
    virtual ~IStatsService() = default;
    virtual Result<StatsResponse> getStats(const StatsRequest& req) = 0;
    virtual Result<RecentResponse> recent(const RecentRequest& req) = 0;
};

} // namespace ktree::app::services
