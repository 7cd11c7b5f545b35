#include "TestUtil.hpp"
#include "analyzers/Analyzer.hpp"
#include "analyzers/RuleRegistry.hpp"
#include <gtest/gtest.h>

using namespace kwl;

namespace {

const char* kInsecurePod = R"(package main

var pod = corev1.Pod{
	ObjectMeta: metav1.ObjectMeta{Name: "web", Labels: map[string]string{"app": "web"}},
	Spec: corev1.PodSpec{
		HostNetwork: true,
		Containers: []corev1.Container{
			{Name: "web", Image: "nginx:latest"},
		},
	},
}
)";

const char* kBroken = "package main\n\nvar pod = corev1.Pod{\n";

class AnalyzerTest : public ::testing::Test {
protected:
  std::unique_ptr<Analyzer> analyzer(Config config = Config()) {
    AnalyzeOptions opts;
    opts.config = std::move(config);
    opts.jobs = 2;
    return makeManifestAnalyzer(defaultRuleRegistry(), std::move(opts));
  }

  static bool hasRule(const std::vector<Issue>& issues, llvm::StringRef id) {
    for (const Issue& i : issues)
      if (i.ruleId == id) return true;
    return false;
  }

  test::TempDir dir;
};

} // namespace

TEST_F(AnalyzerTest, RunsEveryEnabledRule) {
  auto file = test::parse(kInsecurePod);
  ASSERT_TRUE(file);
  auto issues = analyzer()->check(*file);
  EXPECT_TRUE(hasRule(issues, "WK8006"));
  EXPECT_TRUE(hasRule(issues, "WK8207"));
  EXPECT_TRUE(hasRule(issues, "WK8105"));
  EXPECT_FALSE(hasRule(issues, "WK8102"));
}

TEST_F(AnalyzerTest, SeverityThresholdDropsLowerIssues) {
  auto file = test::parse(kInsecurePod);
  ASSERT_TRUE(file);
  Config config;
  config.minSeverity = Severity::Error;
  auto issues = analyzer(std::move(config))->check(*file);
  ASSERT_FALSE(issues.empty());
  for (const Issue& i : issues) EXPECT_EQ(i.severity, Severity::Error) << i.ruleId;
  EXPECT_TRUE(hasRule(issues, "WK8006"));
}

TEST_F(AnalyzerTest, DisabledRulesAreSkipped) {
  auto file = test::parse(kInsecurePod);
  ASSERT_TRUE(file);
  Config config;
  config.disabledRules.insert("WK8006");
  config.disabledRules.insert("WK9999");
  auto issues = analyzer(std::move(config))->check(*file);
  EXPECT_FALSE(hasRule(issues, "WK8006"));
  EXPECT_TRUE(hasRule(issues, "WK8207"));
}

TEST_F(AnalyzerTest, DirectorySkipsUnparseableFiles) {
  dir.write("a/pod.go", kInsecurePod);
  dir.write("b/broken.go", kBroken);
  dir.write("clean.go", "package main\n");
  dir.write("pod_test.go", kInsecurePod);

  auto result = analyzer()->analyzePath(dir.path());
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(result->totalFiles, 3u);
  EXPECT_EQ(result->filesWithIssues, 1u);
  EXPECT_EQ(result->issues.size(),
            result->errorCount + result->warningCount + result->infoCount);
  for (const Issue& i : result->issues) EXPECT_EQ(i.file, dir.path() + "/a/pod.go");
}

TEST_F(AnalyzerTest, DirectoryResultsAreDeterministic) {
  for (int i = 0; i < 6; ++i) dir.write("pod" + std::to_string(i) + ".go", kInsecurePod);

  auto first = analyzer()->analyzePath(dir.path());
  auto second = analyzer()->analyzePath(dir.path());
  ASSERT_TRUE(static_cast<bool>(first)) << llvm::toString(first.takeError());
  ASSERT_TRUE(static_cast<bool>(second)) << llvm::toString(second.takeError());
  ASSERT_EQ(first->issues.size(), second->issues.size());
  for (size_t i = 0; i < first->issues.size(); ++i) {
    EXPECT_EQ(first->issues[i].file, second->issues[i].file);
    EXPECT_EQ(first->issues[i].ruleId, second->issues[i].ruleId);
    EXPECT_EQ(first->issues[i].line, second->issues[i].line);
  }
  EXPECT_EQ(first->filesWithIssues, 6u);
}

TEST_F(AnalyzerTest, MissingPathIsAnError) {
  auto result = analyzer()->analyzePath(dir.path() + "/nope");
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_NE(llvm::toString(result.takeError()).find("path does not exist"), std::string::npos);
}

TEST_F(AnalyzerTest, BrokenSingleFileIsAnError) {
  std::string path = dir.write("broken.go", kBroken);
  auto result = analyzer()->analyzePath(path);
  ASSERT_FALSE(static_cast<bool>(result));
  llvm::consumeError(result.takeError());
}
