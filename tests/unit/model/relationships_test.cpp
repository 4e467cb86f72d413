#include <gtest/gtest.h>

#include <ktree/model/entry.h>
#include <ktree/model/relationships.h>

using namespace ktree::model;

TEST(RelationshipTaxonomyTest, OnlyRelatedAndConflictsWithAreSymmetric) {
    EXPECT_TRUE(isSymmetric(RelationshipKind::Related));
    EXPECT_TRUE(isSymmetric(RelationshipKind::ConflictsWith));
    EXPECT_FALSE(isSymmetric(RelationshipKind::Supersedes));
    EXPECT_FALSE(isSymmetric(RelationshipKind::SupersededBy));
    EXPECT_FALSE(isSymmetric(RelationshipKind::Implements));
    EXPECT_FALSE(isSymmetric(RelationshipKind::ImplementedBy));
}

TEST(RelationshipTaxonomyTest, InverseKinds) {
    EXPECT_EQ(inverseOf(RelationshipKind::Supersedes), RelationshipKind::SupersededBy);
    EXPECT_EQ(inverseOf(RelationshipKind::SupersededBy), RelationshipKind::Supersedes);
    EXPECT_EQ(inverseOf(RelationshipKind::Implements), RelationshipKind::ImplementedBy);
    EXPECT_EQ(inverseOf(RelationshipKind::ImplementedBy), RelationshipKind::Implements);
    EXPECT_EQ(inverseOf(RelationshipKind::Related), RelationshipKind::Related);
    EXPECT_EQ(inverseOf(RelationshipKind::ConflictsWith), RelationshipKind::ConflictsWith);

    EXPECT_TRUE(areInverse(RelationshipKind::Implements, RelationshipKind::ImplementedBy));
    EXPECT_FALSE(areInverse(RelationshipKind::Implements, RelationshipKind::Supersedes));
}

TEST(RelationshipTaxonomyTest, WireNames) {
    EXPECT_EQ(toString(RelationshipKind::SupersededBy), "superseded_by");
    EXPECT_EQ(toString(RelationshipKind::ConflictsWith), "conflicts_with");
    for (auto kind : kAllRelationshipKinds) {
        EXPECT_EQ(parseRelationshipKind(toString(kind)), kind);
        EXPECT_FALSE(displayName(kind).empty());
        EXPECT_FALSE(describe(kind).empty());
    }
    EXPECT_FALSE(parseRelationshipKind("Related").has_value());
    EXPECT_FALSE(parseRelationshipKind("depends_on").has_value());
}

TEST(PriorityTest, NamesAndWeights) {
    EXPECT_EQ(toString(Priority::EdgeCase), "EDGE-CASE");
    EXPECT_EQ(parsePriority("CRITICAL"), Priority::Critical);
    EXPECT_FALSE(parsePriority("critical").has_value());
    EXPECT_FALSE(parsePriority("URGENT").has_value());
    EXPECT_GT(priorityWeight(Priority::Critical), priorityWeight(Priority::Required));
    EXPECT_GT(priorityWeight(Priority::Common), priorityWeight(Priority::EdgeCase));
    EXPECT_EQ(priorityChoices(), "CRITICAL, REQUIRED, COMMON, EDGE-CASE");
}

TEST(EntryTest, RemoveRelationsToDropsEveryKind) {
    Entry entry;
    entry.relatedTo = {{"a.json", RelationshipKind::Related, std::nullopt},
                       {"b.json", RelationshipKind::Implements, std::nullopt},
                       {"a.json", RelationshipKind::Supersedes, std::string("old")}};

    EXPECT_EQ(entry.removeRelationsTo("a.json"), 2u);
    ASSERT_EQ(entry.relatedTo.size(), 1u);
    EXPECT_EQ(entry.relatedTo[0].targetPath, "b.json");
    EXPECT_EQ(entry.removeRelationsTo("a.json"), 0u);
}

TEST(EntryTest, PatchOnlyOverwritesEngagedFields) {
    Entry entry;
    entry.title = "Original";
    entry.priority = Priority::Common;
    entry.problem = "p";
    entry.solution = "s";
    entry.tags = {"x"};

    EntryPatch patch;
    EXPECT_TRUE(patch.empty());
    patch.solution = "better";
    patch.tags = std::vector<std::string>{"y", "y", "", "z"};

    EXPECT_FALSE(patch.empty());
    EXPECT_EQ(patch.fieldNames(), (std::vector<std::string>{"tags", "solution"}));

    patch.applyTo(entry);
    EXPECT_EQ(entry.title, "Original");
    EXPECT_EQ(entry.problem, "p");
    EXPECT_EQ(entry.solution, "better");
    EXPECT_EQ(entry.tags, (std::vector<std::string>{"y", "z"}));
}
