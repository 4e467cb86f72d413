#pragma once

#include <filesystem>
#include <string>

namespace ktree::config {

struct EngineConfig {
    std::filesystem::path knowledgeRoot;
    int defaultDepth = 1;
    int maxDepth = 5;
    bool cleanupLinksOnDelete = true;
    int maxMoveAttempts = 8;
    std::string logLevel = "warn";

    // File the values were read from; empty when none existed
    std::filesystem::path sourceFile;
};

struct ConfigOverrides {
    std::string configPath;
    std::string root;
    std::string logLevel;
};

/**
 * Resolve the engine configuration. Precedence per key: explicit overrides, then environment
 * (KTREE_ROOT, KTREE_LOG_LEVEL), then the config file (KTREE_CONFIG or the XDG location),
 * then defaults. Out-of-range or unparsable values are logged and ignored.
 */
EngineConfig loadEngineConfig(const ConfigOverrides& overrides = {});

// Parse only the config file at `path` on top of the defaults (no environment)
EngineConfig parseEngineConfigFile(const std::filesystem::path& path);

} // namespace ktree::config
