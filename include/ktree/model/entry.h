#pragma once

#include <ktree/model/relationships.h>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ktree::model {

enum class Priority {
    Critical, // architecture violations, security issues, breaking changes
    Required, // must-follow patterns and team standards
    Common,   // frequent issues and their solutions
    EdgeCase, // rare but documented scenarios
};

inline constexpr std::array<Priority, 4> kAllPriorities = {Priority::Critical, Priority::Required,
                                                           Priority::Common, Priority::EdgeCase};

std::string_view toString(Priority priority) noexcept;
std::optional<Priority> parsePriority(std::string_view name) noexcept;
int priorityWeight(Priority priority) noexcept;
std::string_view displayName(Priority priority) noexcept;

// "CRITICAL, REQUIRED, COMMON, EDGE-CASE"
std::string priorityChoices();

/**
 * Outgoing, typed edge stored on the source entry. Identity is
 * (source path, targetPath, kind).
 */
struct Relation {
    std::string targetPath;
    RelationshipKind kind = RelationshipKind::Related;
    std::optional<std::string> description;

    bool sameEdge(const Relation& other) const {
        return targetPath == other.targetPath && kind == other.kind;
    }
    bool operator==(const Relation& other) const = default;
};

struct Example {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> code;
    std::optional<std::string> language;

    bool operator==(const Example& other) const = default;
};

/**
 * Decoded knowledge entry. The path is not part of the document; it is the store key.
 * An absent priority means missing or unrecognized and fails validation.
 */
struct Entry {
    std::optional<std::string> title;
    std::optional<std::string> slug;
    std::optional<Priority> priority;
    std::optional<std::string> category;
    std::vector<std::string> tags;
    std::string problem;
    std::optional<std::string> context;
    std::string solution;
    std::vector<Example> examples;
    std::optional<std::string> code;
    std::vector<Relation> relatedTo;
    std::optional<std::string> author;
    std::optional<std::string> createdAt;
    std::optional<std::string> updatedAt;
    std::optional<std::string> version;

    bool operator==(const Entry& other) const = default;

    bool hasRelationTo(std::string_view target) const;
    const Relation* findRelationTo(std::string_view target) const;
    Relation* findRelationTo(std::string_view target);

    // Drops every relation targeting `target`; returns how many were removed
    std::size_t removeRelationsTo(std::string_view target);
};

/**
 * Field-level patch for Update: only engaged fields overwrite the stored entry.
 */
struct EntryPatch {
    std::optional<std::string> title;
    std::optional<std::string> slug;
    std::optional<Priority> priority;
    std::optional<std::string> category;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> problem;
    std::optional<std::string> context;
    std::optional<std::string> solution;
    std::optional<std::vector<Example>> examples;
    std::optional<std::string> code;
    std::optional<std::vector<Relation>> relatedTo;
    std::optional<std::string> author;
    std::optional<std::string> version;

    bool empty() const;

    // Names of the engaged fields, in document order ("title", "priority", ...)
    std::vector<std::string> fieldNames() const;

    void applyTo(Entry& entry) const;
};

// Order-preserving de-duplication (tags are an ordered set)
std::vector<std::string> normalizeTags(const std::vector<std::string>& tags);

} // namespace ktree::model
