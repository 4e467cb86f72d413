#pragma once

#include <ktree/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace ktree::storage {

inline constexpr std::string_view kEntryExtension = ".json";

// Reserved store-level control file; never treated as an entry
inline constexpr std::string_view kControlFileName = ".knowledge-tree.json";

/**
 * Normalize a caller-supplied entry path into its store key:
 * trimmed, lower-cased, '/'-separated, no leading/trailing or repeated slashes, with a
 * ".json" extension. Empty paths, "." / ".." segments and characters outside
 * [a-z0-9-_./] are rejected with InvalidArgument.
 */
Result<std::string> normalizeEntryPath(std::string_view raw);

// "backend/redis" for "backend/redis/caching.json"; empty for top-level entries
std::string parentOf(std::string_view path);

// "caching" for "backend/redis/caching.json"
std::string stemOf(std::string_view path);

// Appends "-<stamp>" to the filename stem: "a/b.json" -> "a/b-<stamp>.json"
std::string disambiguatePath(std::string_view path, std::int64_t stamp);

// True when `path` sits under directory `prefix` (normalized, without extension)
bool isUnderPrefix(std::string_view path, std::string_view prefix);

} // namespace ktree::storage
