#include <ktree/config/config_helpers.h>
#include <ktree/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace ktree::config {

namespace {

void applyInt(const std::filesystem::path& file, const char* section, const char* key,
              int minValue, int& target) {
    auto raw = parse_config_value(file, section, key);
    if (raw.empty()) {
        return;
    }
    auto value = parse_int(raw);
    if (!value || *value < minValue) {
        spdlog::warn("Ignoring invalid {}.{} = '{}' in {}", section, key, raw, file.string());
        return;
    }
    target = *value;
}

void applyBool(const std::filesystem::path& file, const char* section, const char* key,
               bool& target) {
    auto raw = parse_config_value(file, section, key);
    if (raw.empty()) {
        return;
    }
    auto value = parse_bool(raw);
    if (!value) {
        spdlog::warn("Ignoring invalid {}.{} = '{}' in {}", section, key, raw, file.string());
        return;
    }
    target = *value;
}

void applyFile(const std::filesystem::path& file, EngineConfig& cfg) {
    std::error_code ec;
    if (file.empty() || !std::filesystem::is_regular_file(file, ec)) {
        return;
    }
    cfg.sourceFile = file;

    if (auto root = parse_config_value(file, "core", "root"); !root.empty()) {
        cfg.knowledgeRoot = expand_tilde(root);
    }
    if (auto level = parse_config_value(file, "core", "log_level"); !level.empty()) {
        cfg.logLevel = level;
    }
    applyInt(file, "traversal", "default_depth", 1, cfg.defaultDepth);
    applyInt(file, "traversal", "max_depth", 1, cfg.maxDepth);
    applyBool(file, "delete", "cleanup_links", cfg.cleanupLinksOnDelete);
    applyInt(file, "move", "max_attempts", 1, cfg.maxMoveAttempts);

    if (cfg.defaultDepth > cfg.maxDepth) {
        spdlog::warn("traversal.default_depth {} exceeds max_depth {}, clamping", cfg.defaultDepth,
                     cfg.maxDepth);
        cfg.defaultDepth = cfg.maxDepth;
    }
}

} // namespace

EngineConfig parseEngineConfigFile(const std::filesystem::path& path) {
    EngineConfig cfg;
    applyFile(path, cfg);
    return cfg;
}

EngineConfig loadEngineConfig(const ConfigOverrides& overrides) {
    EngineConfig cfg;
    auto configPath = get_config_path(overrides.configPath);
    applyFile(configPath, cfg);

    if (const char* env = std::getenv("KTREE_ROOT"); env && *env) {
        cfg.knowledgeRoot = expand_tilde(env);
    }
    if (const char* env = std::getenv("KTREE_LOG_LEVEL"); env && *env) {
        cfg.logLevel = env;
    }

    if (!overrides.root.empty()) {
        cfg.knowledgeRoot = expand_tilde(overrides.root);
    }
    if (!overrides.logLevel.empty()) {
        cfg.logLevel = overrides.logLevel;
    }

    if (cfg.knowledgeRoot.empty()) {
        cfg.knowledgeRoot = get_data_dir();
    }

    spdlog::debug("Knowledge root: {} (config: {})", cfg.knowledgeRoot.string(),
                  cfg.sourceFile.empty() ? std::string("none") : cfg.sourceFile.string());
    return cfg;
}

} // namespace ktree::config
