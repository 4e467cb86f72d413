#include <gtest/gtest.h>

#include <ktree/graph/link_synchronizer.h>
#include "test_helpers.h"

using namespace ktree;
using namespace ktree::graph;
using namespace ktree::test;
using model::RelationshipKind;

class LinkSynchronizerTest : public KtreeTest {
protected:
    std::shared_ptr<storage::IEntryStore> store;
    std::unique_ptr<LinkSynchronizer> links;

    void SetUp() override {
        KtreeTest::SetUp();
        store = storage::makeFileEntryStore(testDir);
        links = std::make_unique<LinkSynchronizer>(store);
        ASSERT_TRUE(store->write("a.json", makeEntry("A")));
        ASSERT_TRUE(store->write("b.json", makeEntry("B")));
        ASSERT_TRUE(store->write("c.json", makeEntry("C")));
    }

    model::Entry load(const std::string& path) { return store->read(path).value(); }
};

TEST_F(LinkSynchronizerTest, MirrorsSymmetricKinds) {
    auto source = makeEntry("A");
    source.relatedTo = {relation("b.json", RelationshipKind::Related, std::string("why")),
                        relation("c.json", RelationshipKind::ConflictsWith)};

    auto report = links->sync("a.json", source);
    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.modified, 2u);

    auto b = load("b.json");
    ASSERT_EQ(countRelationsTo(b, "a.json"), 1u);
    EXPECT_EQ(b.findRelationTo("a.json")->kind, RelationshipKind::Related);
    EXPECT_EQ(b.findRelationTo("a.json")->description, "why");

    auto c = load("c.json");
    ASSERT_EQ(countRelationsTo(c, "a.json"), 1u);
    EXPECT_EQ(c.findRelationTo("a.json")->kind, RelationshipKind::ConflictsWith);
}

TEST_F(LinkSynchronizerTest, SyncIsIdempotent) {
    auto source = makeEntry("A");
    source.relatedTo = {relation("b.json")};

    auto first = links->sync("a.json", source);
    EXPECT_EQ(first.modified, 1u);
    auto second = links->sync("a.json", source);
    EXPECT_EQ(second.attempted, 1u);
    EXPECT_EQ(second.modified, 0u);

    EXPECT_EQ(countRelationsTo(load("b.json"), "a.json"), 1u);
}

TEST_F(LinkSynchronizerTest, DirectionalKindsAreNeverMirrored) {
    auto source = makeEntry("A");
    source.relatedTo = {relation("b.json", RelationshipKind::Implements),
                        relation("c.json", RelationshipKind::Supersedes)};

    auto report = links->sync("a.json", source);
    EXPECT_EQ(report.attempted, 0u);
    EXPECT_TRUE(load("b.json").relatedTo.empty());
    EXPECT_TRUE(load("c.json").relatedTo.empty());
}

TEST_F(LinkSynchronizerTest, BrokenTargetsAreReportedAndSkipped) {
    writeRaw("broken.json", "{}");
    auto source = makeEntry("A");
    source.relatedTo = {relation("missing.json"), relation("broken.json"), relation("c.json")};

    auto report = links->sync("a.json", source);
    EXPECT_EQ(report.attempted, 3u);
    EXPECT_EQ(report.modified, 1u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::NotFound);
    EXPECT_EQ(report.failures[1].error.code, ErrorCode::Malformed);

    auto partial = report.asPartialFailure("Mirror sync");
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->code, ErrorCode::PartialFailure);
    EXPECT_EQ(partial->details.size(), 2u);

    EXPECT_TRUE(load("c.json").hasRelationTo("a.json"));
}

TEST_F(LinkSynchronizerTest, RemoveMirrorsDropsReverseLinks) {
    auto source = makeEntry("A");
    source.relatedTo = {relation("b.json"), relation("c.json", RelationshipKind::Implements)};
    links->sync("a.json", source);

    auto c = load("c.json");
    c.relatedTo.push_back(relation("a.json", RelationshipKind::ImplementedBy));
    ASSERT_TRUE(store->write("c.json", c));

    auto report = links->removeMirrors("a.json", source.relatedTo);
    EXPECT_EQ(report.attempted, 1u);
    EXPECT_EQ(report.modified, 1u);
    EXPECT_FALSE(load("b.json").hasRelationTo("a.json"));
    // Directional relations are not touched
    EXPECT_TRUE(load("c.json").hasRelationTo("a.json"));
}
