#include <gtest/gtest.h>

#include <ktree/config/config_helpers.h>
#include <ktree/config/engine_config.h>
#include "test_helpers.h"

#include <cstdlib>

using namespace ktree::config;
using namespace ktree::test;

class EngineConfigTest : public KtreeTest {
protected:
    void SetUp() override {
        KtreeTest::SetUp();
        unsetenv("KTREE_ROOT");
        unsetenv("KTREE_LOG_LEVEL");
        unsetenv("KTREE_CONFIG");
    }

    void TearDown() override {
        unsetenv("KTREE_ROOT");
        unsetenv("KTREE_LOG_LEVEL");
        unsetenv("KTREE_CONFIG");
        KtreeTest::TearDown();
    }
};

TEST_F(EngineConfigTest, ParsesSectionsAndDottedKeys) {
    auto file = writeRaw("config.toml", R"(# ktree settings
[core]
root = "/srv/knowledge"   # where entries live
log_level = 'debug'

[traversal]
default_depth = 2
max_depth = 4

[move]
max_attempts = 3
)");

    auto cfg = parseEngineConfigFile(file);
    EXPECT_EQ(cfg.knowledgeRoot, std::filesystem::path("/srv/knowledge"));
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.defaultDepth, 2);
    EXPECT_EQ(cfg.maxDepth, 4);
    EXPECT_EQ(cfg.maxMoveAttempts, 3);
    EXPECT_EQ(cfg.sourceFile, file);
}

TEST_F(EngineConfigTest, TopLevelDottedKeys) {
    auto file = writeRaw("dotted.toml", "delete.cleanup_links = no\ntraversal.max_depth = 7\n");
    auto cfg = parseEngineConfigFile(file);
    EXPECT_FALSE(cfg.cleanupLinksOnDelete);
    EXPECT_EQ(cfg.maxDepth, 7);
}

TEST_F(EngineConfigTest, InvalidValuesKeepDefaults) {
    auto file = writeRaw("bad.toml", R"([traversal]
default_depth = deep
max_depth = 0
[delete]
cleanup_links = maybe
)");
    auto cfg = parseEngineConfigFile(file);
    EngineConfig defaults;
    EXPECT_EQ(cfg.defaultDepth, defaults.defaultDepth);
    EXPECT_EQ(cfg.maxDepth, defaults.maxDepth);
    EXPECT_EQ(cfg.cleanupLinksOnDelete, defaults.cleanupLinksOnDelete);
}

TEST_F(EngineConfigTest, MissingFileGivesDefaults) {
    auto cfg = parseEngineConfigFile(testDir / "absent.toml");
    EXPECT_EQ(cfg.defaultDepth, 1);
    EXPECT_EQ(cfg.maxDepth, 5);
    EXPECT_TRUE(cfg.cleanupLinksOnDelete);
    EXPECT_TRUE(cfg.sourceFile.empty());
}

TEST_F(EngineConfigTest, PrecedenceOverridesThenEnvThenFile) {
    auto file = writeRaw("config.toml", "[core]\nroot = \"/from/file\"\nlog_level = \"info\"\n");
    setenv("KTREE_CONFIG", file.c_str(), 1);

    auto fromFile = loadEngineConfig();
    EXPECT_EQ(fromFile.knowledgeRoot, std::filesystem::path("/from/file"));
    EXPECT_EQ(fromFile.logLevel, "info");

    setenv("KTREE_ROOT", "/from/env", 1);
    setenv("KTREE_LOG_LEVEL", "error", 1);
    auto fromEnv = loadEngineConfig();
    EXPECT_EQ(fromEnv.knowledgeRoot, std::filesystem::path("/from/env"));
    EXPECT_EQ(fromEnv.logLevel, "error");

    auto explicitRoot = loadEngineConfig({"", "/from/flag", ""});
    EXPECT_EQ(explicitRoot.knowledgeRoot, std::filesystem::path("/from/flag"));
}

TEST(ConfigHelpersTest, ScalarParsing) {
    EXPECT_EQ(parse_int(" 42 "), 42);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
    EXPECT_EQ(unquote("  'x y'  "), "x y");
}
