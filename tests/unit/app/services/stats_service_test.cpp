#include <gtest/gtest.h>

#include <ktree/app/services/factory.hpp>
#include <ktree/core/time_utils.h>
#include "test_helpers.h"

#include <algorithm>
#include <chrono>
#include <set>

using namespace ktree;
using namespace ktree::app::services;
using namespace ktree::test;
using model::Priority;
using model::RelationshipKind;

class StatsServiceTest : public KtreeTest {
protected:
    std::shared_ptr<storage::IEntryStore> store;
    std::shared_ptr<IStatsService> stats;

    void SetUp() override {
        KtreeTest::SetUp();
        store = storage::makeFileEntryStore(testDir);
        auto bundle = makeServices(AppContext{store, nullptr, {}});
        ASSERT_TRUE(bundle.valid());
        stats = bundle.stats;
    }

    void put(const std::string& path, Priority priority = Priority::Common,
             std::vector<model::Relation> relations = {}) {
        auto entry = makeEntry(path, priority);
        entry.relatedTo = std::move(relations);
        ASSERT_TRUE(store->write(path, entry));
    }

    // Entry stamped `createdHoursAgo` and last touched `updatedHoursAgo`
    void putStamped(const std::string& path, int createdHoursAgo, int updatedHoursAgo) {
        auto now = std::chrono::system_clock::now();
        auto entry = makeEntry(path);
        entry.createdAt = formatIso8601(now - std::chrono::hours(createdHoursAgo));
        entry.updatedAt = formatIso8601(now - std::chrono::hours(updatedHoursAgo));
        ASSERT_TRUE(store->write(path, entry));
    }
};

TEST_F(StatsServiceTest, EmptyStoreHasZeroCounts) {
    auto result = stats->getStats({});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& resp = result.value();
    EXPECT_EQ(resp.totalEntries, 0u);
    EXPECT_EQ(resp.totalRelationships, 0u);
    EXPECT_DOUBLE_EQ(resp.averageLinks, 0.0);
    ASSERT_EQ(resp.priorities.size(), model::kAllPriorities.size());
    for (const auto& [priority, count] : resp.priorities) {
        EXPECT_EQ(count, 0u) << model::toString(priority);
    }
}

TEST_F(StatsServiceTest, CountsRelationshipsAndOrphans) {
    put("backend/redis/cache.json", Priority::Critical,
        {relation("backend/db.json"), relation("missing.json", RelationshipKind::Supersedes)});
    put("backend/db.json", Priority::Required, {relation("backend/redis/cache.json")});
    put("notes.json");
    put("frontend/css.json", Priority::EdgeCase);
    writeRaw("broken.json", R"({"title": "no priority"})");

    auto result = stats->getStats({});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& resp = result.value();

    EXPECT_EQ(resp.totalEntries, 4u);
    EXPECT_EQ(resp.unreadable, 1u);
    EXPECT_EQ(resp.withRelationships, 2u);
    EXPECT_EQ(resp.totalRelationships, 3u);
    EXPECT_DOUBLE_EQ(resp.averageLinks, 0.75);
    EXPECT_EQ(resp.orphaned, (std::vector<std::string>{"frontend/css.json", "notes.json"}));
}

TEST_F(StatsServiceTest, PrioritiesOrderedByWeight) {
    put("a.json", Priority::EdgeCase);
    put("b.json", Priority::Critical);
    put("c.json", Priority::Critical);

    auto result = stats->getStats({});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& priorities = result.value().priorities;
    ASSERT_EQ(priorities.size(), 4u);
    EXPECT_EQ(priorities.front().first, Priority::Critical);
    EXPECT_EQ(priorities.front().second, 2u);
    EXPECT_EQ(priorities.back().first, Priority::EdgeCase);
    EXPECT_EQ(priorities.back().second, 1u);
    for (std::size_t i = 1; i < priorities.size(); ++i) {
        EXPECT_GT(model::priorityWeight(priorities[i - 1].first),
                  model::priorityWeight(priorities[i].first));
    }
}

TEST_F(StatsServiceTest, CategoriesFollowFirstPathSegment) {
    put("backend/redis/cache.json", Priority::Critical);
    put("backend/postgres/index.json");
    put("backend/overview.json");
    put("top.json");

    auto result = stats->getStats({});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& categories = result.value().categories;
    ASSERT_EQ(categories.size(), 2u);

    const auto& backend = categories.at("backend");
    EXPECT_EQ(backend.count, 3u);
    EXPECT_EQ(backend.priorities.at("CRITICAL"), 1u);
    EXPECT_EQ(backend.priorities.at("COMMON"), 2u);
    EXPECT_EQ(backend.subcategories, (std::set<std::string>{"postgres", "redis"}));

    EXPECT_EQ(categories.at("root").count, 1u);
    EXPECT_TRUE(categories.at("root").subcategories.empty());
}

TEST_F(StatsServiceTest, MostLinkedIsCappedAndFlagsMissingTargets) {
    put("hub.json");
    put("a.json", Priority::Common, {relation("hub.json"), relation("ghost.json")});
    put("b.json", Priority::Common, {relation("hub.json")});
    put("c.json", Priority::Common, {relation("hub.json"), relation("a.json")});

    auto result = stats->getStats({2});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& linked = result.value().mostLinked;
    ASSERT_EQ(linked.size(), 2u);
    EXPECT_EQ(linked[0].path, "hub.json");
    EXPECT_EQ(linked[0].incomingLinks, 3u);
    EXPECT_TRUE(linked[0].exists);
    // Ties break by path
    EXPECT_EQ(linked[1].path, "a.json");

    auto all = stats->getStats({});
    ASSERT_TRUE(all);
    auto ghost = std::find_if(all.value().mostLinked.begin(), all.value().mostLinked.end(),
                              [](const LinkedCount& l) { return l.path == "ghost.json"; });
    ASSERT_NE(ghost, all.value().mostLinked.end());
    EXPECT_FALSE(ghost->exists);
}

TEST_F(StatsServiceTest, RecentSplitsAddedAndModified) {
    putStamped("new.json", 2, 2);
    putStamped("edited.json", 24 * 30, 5);
    putStamped("stale.json", 24 * 30, 24 * 20);
    put("unstamped.json");

    auto result = stats->recent({});
    ASSERT_TRUE(result) << result.error().describe();
    const auto& resp = result.value();

    EXPECT_EQ(resp.totalChanges, 2u);
    EXPECT_EQ(resp.added, 1u);
    EXPECT_EQ(resp.modified, 1u);
    ASSERT_EQ(resp.entries.size(), 2u);
    EXPECT_EQ(resp.entries[0].path, "new.json");
    EXPECT_EQ(resp.entries[0].change, ChangeType::Added);
    EXPECT_EQ(resp.entries[1].path, "edited.json");
    EXPECT_EQ(resp.entries[1].change, ChangeType::Modified);
    EXPECT_LT(resp.from, resp.to);
}

TEST_F(StatsServiceTest, RecentHonorsTypeLimitAndWindow) {
    putStamped("one.json", 1, 1);
    putStamped("two.json", 3, 3);
    putStamped("three.json", 24 * 30, 4);

    RecentRequest added;
    added.type = ChangeType::Added;
    added.limit = 1;
    auto result = stats->recent(added);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(result.value().totalChanges, 2u);
    ASSERT_EQ(result.value().entries.size(), 1u);
    EXPECT_EQ(result.value().entries[0].path, "one.json");

    RecentRequest wide;
    wide.days = 60;
    auto everything = stats->recent(wide);
    ASSERT_TRUE(everything);
    EXPECT_EQ(everything.value().added, 3u);
    EXPECT_EQ(everything.value().modified, 0u);

    RecentRequest invalid;
    invalid.days = 0;
    auto rejected = stats->recent(invalid);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
}

TEST(ChangeTypeTest, NamesParseBack) {
    EXPECT_EQ(parseChangeType(toString(ChangeType::Added)), ChangeType::Added);
    EXPECT_EQ(parseChangeType("modified"), ChangeType::Modified);
    EXPECT_FALSE(parseChangeType("all").has_value());
}
