#include <ktree/model/relationships.h>

namespace ktree::model {

std::string_view toString(RelationshipKind kind) noexcept {
    switch (kind) {
        case RelationshipKind::Related: return "related";
        case RelationshipKind::Supersedes: return "supersedes";
        case RelationshipKind::SupersededBy: return "superseded_by";
        case RelationshipKind::ConflictsWith: return "conflicts_with";
        case RelationshipKind::Implements: return "implements";
        case RelationshipKind::ImplementedBy: return "implemented_by";
    }
    return "related";
}

std::optional<RelationshipKind> parseRelationshipKind(std::string_view name) noexcept {
    for (auto kind : kAllRelationshipKinds) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

bool isSymmetric(RelationshipKind kind) noexcept {
    return kind == RelationshipKind::Related || kind == RelationshipKind::ConflictsWith;
}

std::optional<RelationshipKind> inverseOf(RelationshipKind kind) noexcept {
    switch (kind) {
        case RelationshipKind::Related: return RelationshipKind::Related;
        case RelationshipKind::ConflictsWith: return RelationshipKind::ConflictsWith;
        case RelationshipKind::Supersedes: return RelationshipKind::SupersededBy;
        case RelationshipKind::SupersededBy: return RelationshipKind::Supersedes;
        case RelationshipKind::Implements: return RelationshipKind::ImplementedBy;
        case RelationshipKind::ImplementedBy: return RelationshipKind::Implements;
    }
    return std::nullopt;
}

bool areInverse(RelationshipKind a, RelationshipKind b) noexcept {
    return inverseOf(a) == b || inverseOf(b) == a;
}

std::string_view displayName(RelationshipKind kind) noexcept {
    switch (kind) {
        case RelationshipKind::Related: return "Related To";
        case RelationshipKind::Supersedes: return "Supersedes";
        case RelationshipKind::SupersededBy: return "Superseded By";
        case RelationshipKind::ConflictsWith: return "Conflicts With";
        case RelationshipKind::Implements: return "Implements";
        case RelationshipKind::ImplementedBy: return "Implemented By";
    }
    return "";
}

std::string_view describe(RelationshipKind kind) noexcept {
    switch (kind) {
        case RelationshipKind::Related:
            return "General connection between entries (bidirectional)";
        case RelationshipKind::Supersedes: return "This entry replaces the target entry";
        case RelationshipKind::SupersededBy: return "This entry is replaced by the target entry";
        case RelationshipKind::ConflictsWith:
            return "Conflicting approaches or patterns (bidirectional)";
        case RelationshipKind::Implements:
            return "This entry implements a pattern defined in the target";
        case RelationshipKind::ImplementedBy:
            return "This entry has implementations in the target";
    }
    return "";
}

} // namespace ktree::model
