#include <ktree/model/entry_codec.h>

#include <spdlog/fmt/fmt.h>

namespace ktree::model {

using json = nlohmann::json;

namespace {

enum class DecodeMode { Strict, Draft };

// Collects every type problem of a document instead of stopping at the first one.
class FieldReader {
public:
    FieldReader(const json& doc, std::vector<std::string>& problems, std::string scope = {})
        : doc_(doc), problems_(problems), scope_(std::move(scope)) {}

    bool has(const char* key) const {
        auto it = doc_.find(key);
        return it != doc_.end() && !it->is_null();
    }

    std::optional<std::string> optString(const char* key) {
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            problem(fmt::format("'{}' must be a string", key));
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::optional<std::vector<std::string>> optStringList(const char* key) {
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_array()) {
            problem(fmt::format("'{}' must be an array of strings", key));
            return std::nullopt;
        }
        std::vector<std::string> out;
        for (const auto& v : *it) {
            if (!v.is_string()) {
                problem(fmt::format("'{}' must be an array of strings", key));
                return std::nullopt;
            }
            out.push_back(v.get<std::string>());
        }
        return out;
    }

    const json* optArray(const char* key) {
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return nullptr;
        }
        if (!it->is_array()) {
            problem(fmt::format("'{}' must be an array", key));
            return nullptr;
        }
        return &*it;
    }

    void problem(std::string msg) {
        if (!scope_.empty()) {
            msg = scope_ + ": " + msg;
        }
        problems_.push_back(std::move(msg));
    }

private:
    const json& doc_;
    std::vector<std::string>& problems_;
    std::string scope_;
};

std::optional<Priority> readPriority(FieldReader& reader, DecodeMode mode) {
    auto raw = reader.optString("priority");
    if (!raw) {
        if (mode == DecodeMode::Strict && !reader.has("priority")) {
            reader.problem("'priority' is required");
        }
        return std::nullopt;
    }
    auto p = parsePriority(*raw);
    if (!p) {
        reader.problem(fmt::format("invalid priority '{}' (expected one of {})", *raw,
                                   priorityChoices()));
    }
    return p;
}

std::vector<Relation> readRelations(const json& arr, std::vector<std::string>& problems) {
    std::vector<Relation> out;
    std::size_t index = 0;
    for (const auto& item : arr) {
        FieldReader reader(item, problems, fmt::format("related_to[{}]", index++));
        if (!item.is_object()) {
            reader.problem("must be an object");
            continue;
        }
        Relation rel;
        auto path = reader.optString("path");
        if (path && !path->empty()) {
            rel.targetPath = *path;
        } else if (path) {
            reader.problem("'path' must be non-empty");
        } else if (!reader.has("path")) {
            reader.problem("'path' is required");
        }
        auto kindName = reader.optString("relationship");
        if (!kindName) {
            if (!reader.has("relationship")) {
                reader.problem("'relationship' is required");
            }
        } else if (auto kind = parseRelationshipKind(*kindName)) {
            rel.kind = *kind;
        } else {
            reader.problem(fmt::format("invalid relationship type '{}'", *kindName));
        }
        rel.description = reader.optString("description");
        out.push_back(std::move(rel));
    }
    return out;
}

std::vector<Example> readExamples(const json& arr, std::vector<std::string>& problems) {
    std::vector<Example> out;
    std::size_t index = 0;
    for (const auto& item : arr) {
        FieldReader reader(item, problems, fmt::format("examples[{}]", index++));
        if (!item.is_object()) {
            reader.problem("must be an object");
            continue;
        }
        Example ex;
        ex.title = reader.optString("title");
        ex.description = reader.optString("description");
        ex.code = reader.optString("code");
        ex.language = reader.optString("language");
        out.push_back(std::move(ex));
    }
    return out;
}

Entry readEntry(const json& doc, DecodeMode mode, std::vector<std::string>& problems) {
    Entry entry;
    FieldReader reader(doc, problems);

    entry.title = reader.optString("title");
    entry.slug = reader.optString("slug");
    entry.priority = readPriority(reader, mode);
    entry.category = reader.optString("category");
    if (auto tags = reader.optStringList("tags")) {
        entry.tags = normalizeTags(*tags);
    }

    auto problem = reader.optString("problem");
    auto solution = reader.optString("solution");
    if (mode == DecodeMode::Strict) {
        if (!problem || problem->empty()) {
            reader.problem("'problem' is required and must be non-empty");
        }
        if (!solution || solution->empty()) {
            reader.problem("'solution' is required and must be non-empty");
        }
    }
    entry.problem = problem.value_or("");
    entry.solution = solution.value_or("");

    entry.context = reader.optString("context");
    if (const auto* arr = reader.optArray("examples")) {
        entry.examples = readExamples(*arr, problems);
    }
    entry.code = reader.optString("code");
    if (const auto* arr = reader.optArray("related_to")) {
        entry.relatedTo = readRelations(*arr, problems);
    }
    entry.author = reader.optString("author");
    entry.createdAt = reader.optString("created_at");
    entry.updatedAt = reader.optString("updated_at");
    entry.version = reader.optString("version");
    return entry;
}

void putOptional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

json toJson(const Relation& relation) {
    json j;
    j["path"] = relation.targetPath;
    j["relationship"] = std::string(toString(relation.kind));
    putOptional(j, "description", relation.description);
    return j;
}

json toJson(const Example& example) {
    json j = json::object();
    putOptional(j, "title", example.title);
    putOptional(j, "description", example.description);
    putOptional(j, "code", example.code);
    putOptional(j, "language", example.language);
    return j;
}

json toJson(const Entry& entry) {
    json j = json::object();
    putOptional(j, "title", entry.title);
    putOptional(j, "slug", entry.slug);
    if (entry.priority) {
        j["priority"] = std::string(toString(*entry.priority));
    }
    putOptional(j, "category", entry.category);
    if (!entry.tags.empty()) {
        j["tags"] = entry.tags;
    }
    j["problem"] = entry.problem;
    putOptional(j, "context", entry.context);
    j["solution"] = entry.solution;
    if (!entry.examples.empty()) {
        json arr = json::array();
        for (const auto& ex : entry.examples) {
            arr.push_back(toJson(ex));
        }
        j["examples"] = std::move(arr);
    }
    putOptional(j, "code", entry.code);
    if (!entry.relatedTo.empty()) {
        json arr = json::array();
        for (const auto& rel : entry.relatedTo) {
            arr.push_back(toJson(rel));
        }
        j["related_to"] = std::move(arr);
    }
    putOptional(j, "author", entry.author);
    putOptional(j, "created_at", entry.createdAt);
    putOptional(j, "updated_at", entry.updatedAt);
    putOptional(j, "version", entry.version);
    return j;
}

std::string encodeEntry(const Entry& entry) {
    return toJson(entry).dump(2);
}

Result<Entry> decodeEntry(std::string_view bytes) {
    json doc;
    try {
        doc = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::Malformed, "Invalid JSON format", {e.what()}};
    }
    return entryFromJson(doc);
}

Result<Entry> entryFromJson(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::Malformed, "Entry document must be a JSON object"};
    }
    std::vector<std::string> problems;
    auto entry = readEntry(doc, DecodeMode::Strict, problems);
    if (!problems.empty()) {
        return Error{ErrorCode::Malformed, "Entry document does not match the entry shape",
                     std::move(problems)};
    }
    return entry;
}

Result<Entry> decodeEntryDraft(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::ValidationError, "Entry must be a JSON object"};
    }
    std::vector<std::string> problems;
    auto entry = readEntry(doc, DecodeMode::Draft, problems);
    if (!problems.empty()) {
        return Error{ErrorCode::ValidationError, "Validation failed", std::move(problems)};
    }
    return entry;
}

Result<EntryPatch> decodeEntryPatch(const json& doc) {
    if (!doc.is_object()) {
        return Error{ErrorCode::ValidationError, "Updates must be a JSON object"};
    }
    std::vector<std::string> problems;
    FieldReader reader(doc, problems);
    EntryPatch patch;

    patch.title = reader.optString("title");
    patch.slug = reader.optString("slug");
    if (reader.has("priority")) {
        patch.priority = readPriority(reader, DecodeMode::Draft);
    }
    patch.category = reader.optString("category");
    patch.tags = reader.optStringList("tags");
    patch.problem = reader.optString("problem");
    patch.context = reader.optString("context");
    patch.solution = reader.optString("solution");
    if (const auto* arr = reader.optArray("examples")) {
        patch.examples = readExamples(*arr, problems);
    }
    patch.code = reader.optString("code");
    if (const auto* arr = reader.optArray("related_to")) {
        patch.relatedTo = readRelations(*arr, problems);
    }
    patch.author = reader.optString("author");
    patch.version = reader.optString("version");

    if (!problems.empty()) {
        return Error{ErrorCode::ValidationError, "Validation failed", std::move(problems)};
    }
    return patch;
}

} // namespace ktree::model
