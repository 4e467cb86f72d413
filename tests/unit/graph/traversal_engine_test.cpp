#include <gtest/gtest.h>

#include <ktree/graph/traversal_engine.h>
#include "test_helpers.h"

using namespace ktree;
using namespace ktree::graph;
using namespace ktree::test;
using json = nlohmann::json;

class TraversalEngineTest : public KtreeTest {
protected:
    std::shared_ptr<storage::IEntryStore> store;
    std::unique_ptr<TraversalEngine> engine;

    void SetUp() override {
        KtreeTest::SetUp();
        store = storage::makeFileEntryStore(testDir);
        engine = std::make_unique<TraversalEngine>(store);
    }

    void put(const std::string& path, std::vector<std::string> targets) {
        auto entry = makeEntry(path);
        for (auto& t : targets) {
            entry.relatedTo.push_back(relation(t));
        }
        ASSERT_TRUE(store->write(path, entry));
    }
};

TEST_F(TraversalEngineTest, DepthOneNeverEmbedsNeighbors) {
    put("a.json", {"b.json"});
    put("b.json", {});

    auto node = engine->readWithDepth("a.json", 1);
    ASSERT_TRUE(node) << node.error().describe();
    EXPECT_FALSE(node.value().circular);
    ASSERT_TRUE(node.value().entry.has_value());
    EXPECT_FALSE(node.value().linked.has_value());

    auto j = toJson(node.value());
    EXPECT_EQ(j["path"], "a.json");
    EXPECT_EQ(j["title"], "a.json");
    EXPECT_FALSE(j.contains("linked_entries"));
}

TEST_F(TraversalEngineTest, ThreeHopChain) {
    put("a.json", {"b.json"});
    put("b.json", {"c.json"});
    put("c.json", {"d.json"});
    put("d.json", {});

    auto result = engine->readWithDepth("a.json", 3);
    ASSERT_TRUE(result);
    const auto& a = result.value();

    ASSERT_TRUE(a.linked.has_value());
    ASSERT_EQ(a.linked->size(), 1u);
    const auto& b = *a.linked->at(0).content;
    EXPECT_EQ(b.path, "b.json");

    ASSERT_TRUE(b.linked.has_value());
    const auto& c = *b.linked->at(0).content;
    EXPECT_EQ(c.path, "c.json");
    EXPECT_FALSE(c.linked.has_value());
    EXPECT_EQ(countResolved(a), 3u);

    auto j = toJson(a);
    EXPECT_EQ(j["linked_entries"]["b.json"]["relationship"], "related");
    const auto& bJson = j["linked_entries"]["b.json"]["content"];
    EXPECT_EQ(bJson["linked_entries"]["c.json"]["content"]["path"], "c.json");
}

TEST_F(TraversalEngineTest, CycleTerminatesWithMarker) {
    put("a.json", {"b.json"});
    put("b.json", {"a.json"});

    auto result = engine->readWithDepth("a.json", 3);
    ASSERT_TRUE(result);

    const auto& b = *result.value().linked->at(0).content;
    EXPECT_EQ(b.path, "b.json");
    ASSERT_TRUE(b.linked.has_value());
    const auto& marker = *b.linked->at(0).content;
    EXPECT_TRUE(marker.circular);
    EXPECT_EQ(marker.path, "a.json");
    EXPECT_FALSE(marker.entry.has_value());

    auto j = toJson(result.value());
    EXPECT_EQ(j["linked_entries"]["b.json"]["content"]["linked_entries"]["a.json"]["content"],
              (json{{"circular_reference", "a.json"}}));
}

TEST_F(TraversalEngineTest, SiblingsDoNotSuppressEachOther) {
    // a -> b, a -> c, b -> c: c is reached twice on different branches
    put("a.json", {"b.json", "c.json"});
    put("b.json", {"c.json"});
    put("c.json", {});

    auto result = engine->readWithDepth("a.json", 3);
    ASSERT_TRUE(result);
    const auto& links = *result.value().linked;
    ASSERT_EQ(links.size(), 2u);

    const auto& viaB = *links[0].content->linked->at(0).content;
    EXPECT_FALSE(viaB.circular);
    EXPECT_EQ(viaB.path, "c.json");
    EXPECT_FALSE(links[1].content->circular);
}

TEST_F(TraversalEngineTest, MissingNeighborIsEmbeddedAsError) {
    put("a.json", {"gone.json", "b.json"});
    put("b.json", {});

    auto result = engine->readWithDepth("a.json", 2);
    ASSERT_TRUE(result);
    const auto& links = *result.value().linked;
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(links[0].content, nullptr);
    ASSERT_TRUE(links[0].error.has_value());
    EXPECT_NE(links[0].error->find("Failed to load linked entry"), std::string::npos);
    EXPECT_NE(links[1].content, nullptr);

    auto j = toJson(result.value());
    EXPECT_TRUE(j["linked_entries"]["gone.json"].contains("error"));
    EXPECT_FALSE(j["linked_entries"]["gone.json"].contains("content"));
}

TEST_F(TraversalEngineTest, RootFailurePropagates) {
    auto missing = engine->readWithDepth("nope.json", 2);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    writeRaw("bad.json", "[]");
    auto bad = engine->readWithDepth("bad.json", 2);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::Malformed);
}
