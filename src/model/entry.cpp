#include <ktree/model/entry.h>

#include <algorithm>
#include <unordered_set>

namespace ktree::model {

std::string_view toString(Priority priority) noexcept {
    switch (priority) {
        case Priority::Critical: return "CRITICAL";
        case Priority::Required: return "REQUIRED";
        case Priority::Common: return "COMMON";
        case Priority::EdgeCase: return "EDGE-CASE";
    }
    return "COMMON";
}

std::optional<Priority> parsePriority(std::string_view name) noexcept {
    for (auto p : kAllPriorities) {
        if (toString(p) == name) {
            return p;
        }
    }
    return std::nullopt;
}

int priorityWeight(Priority priority) noexcept {
    switch (priority) {
        case Priority::Critical: return 4;
        case Priority::Required: return 3;
        case Priority::Common: return 2;
        case Priority::EdgeCase: return 1;
    }
    return 0;
}

std::string_view displayName(Priority priority) noexcept {
    switch (priority) {
        case Priority::Critical: return "Critical";
        case Priority::Required: return "Required";
        case Priority::Common: return "Common";
        case Priority::EdgeCase: return "Edge Case";
    }
    return "";
}

std::string priorityChoices() {
    std::string out;
    for (auto p : kAllPriorities) {
        if (!out.empty()) {
            out += ", ";
        }
        out += toString(p);
    }
    return out;
}

bool Entry::hasRelationTo(std::string_view target) const {
    return findRelationTo(target) != nullptr;
}

const Relation* Entry::findRelationTo(std::string_view target) const {
    auto it = std::find_if(relatedTo.begin(), relatedTo.end(),
                           [&](const Relation& r) { return r.targetPath == target; });
    return it == relatedTo.end() ? nullptr : &*it;
}

Relation* Entry::findRelationTo(std::string_view target) {
    auto it = std::find_if(relatedTo.begin(), relatedTo.end(),
                           [&](const Relation& r) { return r.targetPath == target; });
    return it == relatedTo.end() ? nullptr : &*it;
}

std::size_t Entry::removeRelationsTo(std::string_view target) {
    auto before = relatedTo.size();
    relatedTo.erase(std::remove_if(relatedTo.begin(), relatedTo.end(),
                                   [&](const Relation& r) { return r.targetPath == target; }),
                    relatedTo.end());
    return before - relatedTo.size();
}

bool EntryPatch::empty() const {
    return fieldNames().empty();
}

std::vector<std::string> EntryPatch::fieldNames() const {
    std::vector<std::string> names;
    if (title)
        names.emplace_back("title");
    if (slug)
        names.emplace_back("slug");
    if (priority)
        names.emplace_back("priority");
    if (category)
        names.emplace_back("category");
    if (tags)
        names.emplace_back("tags");
    if (problem)
        names.emplace_back("problem");
    if (context)
        names.emplace_back("context");
    if (solution)
        names.emplace_back("solution");
    if (examples)
        names.emplace_back("examples");
    if (code)
        names.emplace_back("code");
    if (relatedTo)
        names.emplace_back("related_to");
    if (author)
        names.emplace_back("author");
    if (version)
        names.emplace_back("version");
    return names;
}

void EntryPatch::applyTo(Entry& entry) const {
    if (title)
        entry.title = *title;
    if (slug)
        entry.slug = *slug;
    if (priority)
        entry.priority = *priority;
    if (category)
        entry.category = *category;
    if (tags)
        entry.tags = normalizeTags(*tags);
    if (problem)
        entry.problem = *problem;
    if (context)
        entry.context = *context;
    if (solution)
        entry.solution = *solution;
    if (examples)
        entry.examples = *examples;
    if (code)
        entry.code = *code;
    if (relatedTo)
        entry.relatedTo = *relatedTo;
    if (author)
        entry.author = *author;
    if (version)
        entry.version = *version;
}

std::vector<std::string> normalizeTags(const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    out.reserve(tags.size());
    for (const auto& t : tags) {
        if (t.empty())
            continue;
        if (seen.insert(t).second) {
            out.push_back(t);
        }
    }
    return out;
}

} // namespace ktree::model
