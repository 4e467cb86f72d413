#include <ktree/storage/path_utils.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace ktree::storage {

namespace {

bool isAllowedPathChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
           c == '/';
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

Result<std::string> normalizeEntryPath(std::string_view raw) {
    auto trimmed = trimView(raw);
    if (trimmed.empty()) {
        return Error{ErrorCode::InvalidArgument, "Path is required and must be non-empty"};
    }

    std::string lowered;
    lowered.reserve(trimmed.size() + kEntryExtension.size());
    for (char c : trimmed) {
        char ch = (c == '\\') ? '/'
                              : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        // Collapse repeated separators
        if (ch == '/' && !lowered.empty() && lowered.back() == '/') {
            continue;
        }
        lowered.push_back(ch);
    }

    while (!lowered.empty() && lowered.front() == '/') {
        lowered.erase(lowered.begin());
    }
    while (!lowered.empty() && lowered.back() == '/') {
        lowered.pop_back();
    }
    if (lowered.empty()) {
        return Error{ErrorCode::InvalidArgument, "Path is required and must be non-empty"};
    }

    auto bad = std::find_if(lowered.begin(), lowered.end(),
                            [](char c) { return !isAllowedPathChar(c); });
    if (bad != lowered.end()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Path '{}' contains invalid character '{}'", raw, *bad)};
    }

    if (!lowered.ends_with(kEntryExtension)) {
        lowered += kEntryExtension;
    }

    std::size_t start = 0;
    while (start <= lowered.size()) {
        auto end = lowered.find('/', start);
        auto segment = std::string_view(lowered).substr(
            start, end == std::string::npos ? std::string::npos : end - start);
        if (segment == "." || segment == ".." || segment == kEntryExtension) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Path '{}' contains an invalid segment", raw)};
        }
        if (segment.starts_with('.')) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Path '{}' contains a hidden segment", raw)};
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return lowered;
}

std::string parentOf(std::string_view path) {
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return std::string(path.substr(0, slash));
}

std::string stemOf(std::string_view path) {
    auto slash = path.rfind('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    if (name.ends_with(kEntryExtension)) {
        name.remove_suffix(kEntryExtension.size());
    }
    return std::string(name);
}

std::string disambiguatePath(std::string_view path, std::int64_t stamp) {
    auto parent = parentOf(path);
    auto name = fmt::format("{}-{}{}", stemOf(path), stamp, kEntryExtension);
    return parent.empty() ? name : parent + "/" + name;
}

bool isUnderPrefix(std::string_view path, std::string_view prefix) {
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.remove_suffix(1);
    }
    if (prefix.empty()) {
        return true;
    }
    return path.size() > prefix.size() && path.starts_with(prefix) && path[prefix.size()] == '/';
}

} // namespace ktree::storage
