#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace ktree::model {

/**
 * Closed set of relationship kinds an entry may hold towards another entry.
 *
 * Symmetric kinds (related, conflicts_with) are mirrored on the target entry by the
 * LinkSynchronizer. Directional kinds have an inverse kind, but the inverse edge is never
 * created automatically.
 */
enum class RelationshipKind {
    Related,
    Supersedes,
    SupersededBy,
    ConflictsWith,
    Implements,
    ImplementedBy,
};

inline constexpr std::array<RelationshipKind, 6> kAllRelationshipKinds = {
    RelationshipKind::Related,       RelationshipKind::Supersedes,
    RelationshipKind::SupersededBy,  RelationshipKind::ConflictsWith,
    RelationshipKind::Implements,    RelationshipKind::ImplementedBy,
};

// Wire name as stored in entry documents ("related", "superseded_by", ...)
std::string_view toString(RelationshipKind kind) noexcept;

std::optional<RelationshipKind> parseRelationshipKind(std::string_view name) noexcept;

bool isSymmetric(RelationshipKind kind) noexcept;

// Inverse kind; symmetric kinds are their own inverse
std::optional<RelationshipKind> inverseOf(RelationshipKind kind) noexcept;

bool areInverse(RelationshipKind a, RelationshipKind b) noexcept;

std::string_view displayName(RelationshipKind kind) noexcept;
std::string_view describe(RelationshipKind kind) noexcept;

} // namespace ktree::model
