#include <gtest/gtest.h>

#include <ktree/cli/cli_output.h>
#include <ktree/cli/ktree_cli.h>
#include <ktree/storage/entry_store.h>
#include "test_helpers.h"

#include <string>
#include <vector>

using namespace ktree;
using namespace ktree::test;

class KtreeCliTest : public KtreeTest {
protected:
    std::filesystem::path root;

    void SetUp() override {
        KtreeTest::SetUp();
        root = testDir / "knowledge";
    }

    int runCli(std::vector<std::string> args) {
        args.insert(args.begin(), {"ktree", "--root", root.string()});
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        cli::KtreeCLI app;
        return app.run(static_cast<int>(argv.size()), argv.data());
    }

    std::string document(const std::string& title) {
        return writeRaw(title + ".input.json",
                        R"({"title": ")" + title +
                            R"(", "priority": "COMMON", "problem": "p", "solution": "s"})")
            .string();
    }
};

TEST_F(KtreeCliTest, AddLinkMoveDelete) {
    ASSERT_EQ(runCli({"add", "backend/a", "--file", document("a")}), 0);
    ASSERT_EQ(runCli({"add", "backend/b", "--file", document("b")}), 0);
    ASSERT_EQ(runCli({"link", "backend/a", "backend/b", "--kind", "related"}), 0);

    auto store = storage::makeFileEntryStore(root);
    auto b = store->read("backend/b.json");
    ASSERT_TRUE(b) << b.error().describe();
    EXPECT_EQ(countRelationsTo(b.value(), "backend/a.json"), 1u);

    ASSERT_EQ(runCli({"--json", "get", "backend/a", "--depth", "2"}), 0);
    ASSERT_EQ(runCli({"mv", "backend/a", "archive/a"}), 0);
    EXPECT_EQ(countRelationsTo(store->read("backend/b.json").value(), "archive/a.json"), 1u);

    ASSERT_EQ(runCli({"rm", "archive/a"}), 0);
    EXPECT_FALSE(store->exists("archive/a.json").value());
    EXPECT_EQ(countRelationsTo(store->read("backend/b.json").value(), "archive/a.json"), 0u);

    EXPECT_EQ(runCli({"validate"}), 0);
}

TEST_F(KtreeCliTest, FailuresReturnNonZero) {
    EXPECT_NE(runCli({"get", "missing"}), 0);
    EXPECT_NE(runCli({"add", "x", "--file", (testDir / "absent.json").string()}), 0);
    EXPECT_NE(runCli({"link", "a", "b", "--kind", "likes"}), 0);
}

TEST_F(KtreeCliTest, StatsAndRecentReports) {
    ASSERT_EQ(runCli({"add", "backend/a", "--file", document("a")}), 0);
    ASSERT_EQ(runCli({"add", "b", "--file", document("b")}), 0);

    EXPECT_EQ(runCli({"stats"}), 0);
    EXPECT_EQ(runCli({"--json", "stats", "--top", "1"}), 0);
    EXPECT_EQ(runCli({"recent", "--days", "1", "--type", "added"}), 0);
    EXPECT_EQ(runCli({"--json", "recent", "--limit", "5"}), 0);
    EXPECT_NE(runCli({"recent", "--type", "renamed"}), 0);
}

TEST(CliOutputTest, ReportJsonLayout) {
    graph::SideEffectReport report;
    report.attempted = 2;
    report.modified = 1;
    report.fail("b.json", Error{ErrorCode::Malformed, "bad document"});

    auto j = cli::toJson(report);
    EXPECT_EQ(j["attempted"], 2);
    EXPECT_EQ(j["modified"], 1);
    ASSERT_EQ(j["failures"].size(), 1u);
    EXPECT_EQ(j["failures"][0]["path"], "b.json");
}

TEST_F(KtreeCliTest, ReadJsonInputRejectsInvalidJson) {
    auto file = writeRaw("bad.input.json", "{oops");
    auto parsed = cli::readJsonInput(file.string());
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}
