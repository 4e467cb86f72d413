#include <gtest/gtest.h>

#include <ktree/storage/path_utils.h>

using namespace ktree;
using namespace ktree::storage;

TEST(PathUtilsTest, NormalizesUserPaths) {
    EXPECT_EQ(normalizeEntryPath("Backend/Redis/Caching").value(), "backend/redis/caching.json");
    EXPECT_EQ(normalizeEntryPath("  /backend//redis/caching.json/ ").value(),
              "backend/redis/caching.json");
    EXPECT_EQ(normalizeEntryPath("backend\\redis\\caching").value(),
              "backend/redis/caching.json");
    EXPECT_EQ(normalizeEntryPath("top-level_entry").value(), "top-level_entry.json");
}

TEST(PathUtilsTest, RejectsInvalidPaths) {
    for (const char* raw : {"", "   ", "///", "a/../b", "./a", "a/.hidden", "a b", "a/*.json"}) {
        auto result = normalizeEntryPath(raw);
        ASSERT_FALSE(result) << raw;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument) << raw;
    }
}

TEST(PathUtilsTest, ParentAndStem) {
    EXPECT_EQ(parentOf("backend/redis/caching.json"), "backend/redis");
    EXPECT_EQ(parentOf("caching.json"), "");
    EXPECT_EQ(stemOf("backend/redis/caching.json"), "caching");
}

TEST(PathUtilsTest, DisambiguateAppendsStampToStem) {
    EXPECT_EQ(disambiguatePath("backend/redis/caching.json", 1700000000000),
              "backend/redis/caching-1700000000000.json");
    EXPECT_EQ(disambiguatePath("caching.json", 7), "caching-7.json");
}

TEST(PathUtilsTest, PrefixMatchesWholeSegments) {
    EXPECT_TRUE(isUnderPrefix("backend/redis/caching.json", "backend"));
    EXPECT_TRUE(isUnderPrefix("backend/redis/caching.json", "backend/redis/"));
    EXPECT_FALSE(isUnderPrefix("backend-old/x.json", "backend"));
    EXPECT_TRUE(isUnderPrefix("anything.json", ""));
}
