#include <gtest/gtest.h>

#include <ktree/graph/reference_rewriter.h>
#include "faulty_entry_store.h"
#include "test_helpers.h"

using namespace ktree;
using namespace ktree::graph;
using namespace ktree::test;
using model::RelationshipKind;

class ReferenceRewriterTest : public KtreeTest {
protected:
    std::shared_ptr<storage::IEntryStore> store;

    void SetUp() override {
        KtreeTest::SetUp();
        store = storage::makeFileEntryStore(testDir);

        auto b = makeEntry("B");
        b.relatedTo = {relation("a.json"), relation("d.json", RelationshipKind::Implements)};
        auto c = makeEntry("C");
        c.relatedTo = {relation("a.json", RelationshipKind::Supersedes),
                       relation("a.json", RelationshipKind::ConflictsWith)};
        ASSERT_TRUE(store->write("a.json", makeEntry("A")));
        ASSERT_TRUE(store->write("b.json", b));
        ASSERT_TRUE(store->write("c.json", c));
        ASSERT_TRUE(store->write("d.json", makeEntry("D")));
    }

    model::Entry load(const std::string& path) { return store->read(path).value(); }
};

TEST_F(ReferenceRewriterTest, CountIncoming) {
    ReferenceRewriter rewriter(store);
    EXPECT_EQ(rewriter.countIncoming("a.json").value(), 2u);
    EXPECT_EQ(rewriter.countIncoming("d.json").value(), 1u);
    EXPECT_EQ(rewriter.countIncoming("b.json").value(), 0u);
}

TEST_F(ReferenceRewriterTest, StripRemovesOnlyRelationsToDeadPath) {
    ReferenceRewriter rewriter(store);
    auto report = rewriter.strip("a.json");

    EXPECT_EQ(report.modified, 2u);
    EXPECT_TRUE(report.complete());

    auto b = load("b.json");
    ASSERT_EQ(b.relatedTo.size(), 1u);
    EXPECT_EQ(b.relatedTo[0].targetPath, "d.json");
    EXPECT_TRUE(load("c.json").relatedTo.empty());
    EXPECT_TRUE(load("d.json").relatedTo.empty());
}

TEST_F(ReferenceRewriterTest, RewriteRetargetsEveryMatchingRelation) {
    ReferenceRewriter rewriter(store);
    auto report = rewriter.rewrite("a.json", "moved/a.json");

    EXPECT_EQ(report.modified, 2u);
    auto c = load("c.json");
    ASSERT_EQ(c.relatedTo.size(), 2u);
    EXPECT_EQ(c.relatedTo[0].targetPath, "moved/a.json");
    EXPECT_EQ(c.relatedTo[0].kind, RelationshipKind::Supersedes);
    EXPECT_EQ(c.relatedTo[1].targetPath, "moved/a.json");
    EXPECT_EQ(load("b.json").relatedTo[1].targetPath, "d.json");
}

TEST_F(ReferenceRewriterTest, UnchangedEntriesAreNotRewritten) {
    ReferenceRewriter rewriter(store);
    auto before = store->getStats().writes.load();
    auto report = rewriter.rewrite("nothing.json", "else.json");
    EXPECT_EQ(report.modified, 0u);
    EXPECT_EQ(store->getStats().writes.load(), before);
}

TEST_F(ReferenceRewriterTest, FailuresAreSkippedAndReported) {
    writeRaw("broken.json", "not json");
    auto faulty = std::make_shared<FaultyEntryStore>(store);
    faulty->failWritesTo("b.json");

    ReferenceRewriter rewriter(faulty);
    auto report = rewriter.strip("a.json");

    EXPECT_EQ(report.modified, 1u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_FALSE(report.complete());
    EXPECT_EQ(report.warnings("Link cleanup").size(), 2u);

    EXPECT_TRUE(load("b.json").hasRelationTo("a.json"));
    EXPECT_FALSE(load("c.json").hasRelationTo("a.json"));
}
