#include "analyzers/RuleRegistry.hpp"
#include "report/Formatter.hpp"
#include "llvm/Support/JSON.h"
#include <gtest/gtest.h>

using namespace kwl;

namespace {

Issue makeIssue(std::string rule, std::string file, unsigned line, unsigned column,
                Severity severity, std::string message) {
  Issue i;
  i.ruleId = std::move(rule);
  i.file = std::move(file);
  i.line = line;
  i.column = column;
  i.severity = severity;
  i.message = std::move(message);
  return i;
}

class FormatterTest : public ::testing::Test {
protected:
  void SetUp() override {
    result.totalFiles = 3;
    result.add({makeIssue("WK8105", "b.go", 4, 2, Severity::Warning, "policy"),
                makeIssue("WK8006", "b.go", 4, 2, Severity::Error, "latest")});
    result.add({makeIssue("WK8302", "a.go", 9, 1, Severity::Info, "replicas")});
  }

  std::string render(OutputFormat format, const LintResult& r) {
    std::string out;
    llvm::raw_string_ostream os(out);
    makeFormatter(format)->format(r, os);
    os.flush();
    return out;
  }

  LintResult result;
};

} // namespace

TEST(OutputFormatTest, ParsesKnownNames) {
  EXPECT_EQ(parseOutputFormat("json"), OutputFormat::Json);
  EXPECT_EQ(parseOutputFormat("github"), OutputFormat::GitHub);
  EXPECT_EQ(parseOutputFormat("text"), OutputFormat::Text);
  EXPECT_FALSE(parseOutputFormat("xml").has_value());
}

TEST_F(FormatterTest, IssuesSortByLocationThenRule) {
  auto sorted = sortedIssues(result.issues);
  ASSERT_EQ(sorted.size(), 3u);
  EXPECT_EQ(sorted[0].ruleId, "WK8302");
  EXPECT_EQ(sorted[1].ruleId, "WK8006");
  EXPECT_EQ(sorted[2].ruleId, "WK8105");
}

TEST_F(FormatterTest, TextListsIssuesAndTotals) {
  EXPECT_EQ(render(OutputFormat::Text, result),
            "a.go:9:1: info [WK8302] replicas\n"
            "b.go:4:2: error [WK8006] latest\n"
            "b.go:4:2: warning [WK8105] policy\n"
            "\nFound 3 issue(s) in 2 file(s):\n"
            "  - 1 error(s)\n"
            "  - 1 warning(s)\n"
            "  - 1 info\n");
}

TEST_F(FormatterTest, EmptyResultSaysSo) {
  EXPECT_EQ(render(OutputFormat::Text, LintResult()), "No issues found.\n");
  EXPECT_EQ(render(OutputFormat::GitHub, LintResult()), "No issues found.\n");
}

TEST_F(FormatterTest, JsonCarriesIssuesAndCounts) {
  auto parsed = llvm::json::parse(render(OutputFormat::Json, result));
  ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());
  const llvm::json::Object* root = parsed->getAsObject();
  ASSERT_TRUE(root);
  EXPECT_EQ(root->getInteger("total_files"), int64_t{3});
  EXPECT_EQ(root->getInteger("files_with_issues"), int64_t{2});
  EXPECT_EQ(root->getInteger("error_count"), int64_t{1});
  EXPECT_EQ(root->getInteger("warning_count"), int64_t{1});
  EXPECT_EQ(root->getInteger("info_count"), int64_t{1});

  const llvm::json::Array* issues = root->getArray("issues");
  ASSERT_TRUE(issues);
  ASSERT_EQ(issues->size(), 3u);
  const llvm::json::Object* first = (*issues)[0].getAsObject();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->getString("rule"), llvm::StringRef("WK8302"));
  EXPECT_EQ(first->getString("file"), llvm::StringRef("a.go"));
  EXPECT_EQ(first->getString("severity"), llvm::StringRef("info"));
  EXPECT_EQ(first->getInteger("line"), int64_t{9});
  EXPECT_EQ(first->getInteger("column"), int64_t{1});
}

TEST_F(FormatterTest, JsonEmptyResultHasEmptyArray) {
  auto parsed = llvm::json::parse(render(OutputFormat::Json, LintResult()));
  ASSERT_TRUE(static_cast<bool>(parsed)) << llvm::toString(parsed.takeError());
  const llvm::json::Array* issues = parsed->getAsObject()->getArray("issues");
  ASSERT_TRUE(issues);
  EXPECT_TRUE(issues->empty());
}

TEST_F(FormatterTest, GitHubAnnotations) {
  EXPECT_EQ(render(OutputFormat::GitHub, result),
            "::notice file=a.go,line=9,col=1,title=WK8302::replicas\n"
            "::error file=b.go,line=4,col=2,title=WK8006::latest\n"
            "::warning file=b.go,line=4,col=2,title=WK8105::policy\n"
            "\nFound 3 issue(s) in 2 file(s)\n");
}

TEST_F(FormatterTest, SummaryCountsPerRule) {
  result.add({makeIssue("WK8006", "c.go", 1, 1, Severity::Error, "latest")});
  auto summary = summarizeByRule(result.issues, defaultRuleRegistry());
  ASSERT_EQ(summary.size(), 3u);
  EXPECT_EQ(summary[0].ruleId, "WK8006");
  EXPECT_EQ(summary[0].count, 2u);
  EXPECT_EQ(summary[0].severity, Severity::Error);
  EXPECT_EQ(summary[0].description,
            "Images should be pinned to a version tag instead of :latest");
  EXPECT_EQ(summary[2].ruleId, "WK8302");
}
