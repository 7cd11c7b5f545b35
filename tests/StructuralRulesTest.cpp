#include "TestUtil.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "analyzers/Rules.hpp"
#include "syntax/Printer.hpp"
#include <gtest/gtest.h>

using namespace kwl;
using namespace kwl::syntax;

namespace {

const char* const kDeepDeployment = R"(package main

var deep = appsv1.Deployment{
	Spec: appsv1.DeploymentSpec{
		Template: corev1.PodTemplateSpec{
			Spec: corev1.PodSpec{
				Containers: []corev1.Container{
					{Name: "web"},
				},
			},
		},
	},
}
)";

} // namespace

TEST(StructuralRulesTest, CallInitializerIsFlagged) {
  auto issues = test::runRule("WK8001", test::manifest(R"(var web = makeDeployment("web")
var ok = appsv1.Deployment{}
var ptr = &appsv1.Deployment{}
)"));
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].message, "Resource \"web\" is assigned from a function call, declare it as "
                               "a top-level composite literal instead");
  EXPECT_EQ(issues[0].line, 3u);
  EXPECT_EQ(issues[0].column, 5u);
  EXPECT_EQ(issues[0].severity, Severity::Error);
}

TEST(StructuralRulesTest, AddressOfCallIsFlagged) {
  auto issues = test::runRule("WK8001", test::manifest("var web = &build()\n"));
  EXPECT_EQ(issues.size(), 1u);
}

TEST(StructuralRulesTest, NestingDepthCountsLiteralLevels) {
  auto file = test::parse(kDeepDeployment);
  ASSERT_TRUE(file);
  const auto* vd = llvm::cast<ValueDecl>(file->decls[0].get());
  EXPECT_EQ(rules::nestingDepth(vd->specs[0].valueFor(0)), 6u);
}

TEST(StructuralRulesTest, DepthSixIsReported) {
  auto issues = test::runRule("WK8002", kDeepDeployment);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].message, "Variable \"deep\" has nesting depth 6 (max 5), extract nested "
                               "structures into separate variables");
  EXPECT_EQ(issues[0].line, 3u);
  EXPECT_EQ(issues[0].column, 5u);
  EXPECT_EQ(issues[0].severity, Severity::Warning);
}

TEST(StructuralRulesTest, DepthFiveIsAllowed) {
  auto issues = test::runRule("WK8002", test::manifest(R"(var ok = appsv1.DeploymentSpec{
	Template: corev1.PodTemplateSpec{
		Spec: corev1.PodSpec{
			Containers: []corev1.Container{{Name: "web"}},
		},
	},
}
)"));
  EXPECT_TRUE(issues.empty());
}

TEST(StructuralRulesTest, ExtractionHoistsDeepLiterals) {
  auto file = test::parse(kDeepDeployment);
  ASSERT_TRUE(file);
  auto results = rules::extractDeepNesting(*file);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].fixed);
  EXPECT_EQ(results[0].ruleId, "WK8002");
  EXPECT_EQ(results[0].description, "Extracted 2 nested structure(s) from deep at line 3");

  EXPECT_EQ(print(*file), R"(package main

var deepNested1 = corev1.Container{Name: "web"}

var deepContainers2 = []corev1.Container{
	deepNested1,
}

var deep = appsv1.Deployment{
	Spec: appsv1.DeploymentSpec{
		Template: corev1.PodTemplateSpec{
			Spec: corev1.PodSpec{
				Containers: deepContainers2,
			},
		},
	},
}
)");
}

TEST(StructuralRulesTest, ExtractionIsIdempotent) {
  auto file = test::parse(kDeepDeployment);
  ASSERT_TRUE(file);
  rules::extractDeepNesting(*file);

  auto reparsed = test::parse(print(*file));
  ASSERT_TRUE(reparsed);
  const Rule* rule = defaultRuleRegistry().find("WK8002");
  ASSERT_TRUE(rule);
  EXPECT_TRUE(rule->check(*reparsed).empty());
  EXPECT_TRUE(rules::extractDeepNesting(*reparsed).empty());
  EXPECT_FALSE(reparsed->edited());
}

TEST(StructuralRulesTest, ExtractedNamesAvoidExistingVariables) {
  std::string text = kDeepDeployment;
  text += "\nvar deepNested1 = 1\n";
  auto file = test::parse(text);
  ASSERT_TRUE(file);
  rules::extractDeepNesting(*file);
  std::string out = print(*file);
  EXPECT_NE(out.find("var deepNested2 = corev1.Container{Name: \"web\"}"), std::string::npos);
  EXPECT_NE(out.find("var deepContainers3 = []corev1.Container{"), std::string::npos);
}

TEST(StructuralRulesTest, PointerElementsAreHoistedWithAddress) {
  auto file = test::parse(R"(package main

var deep = appsv1.Deployment{
	Spec: appsv1.DeploymentSpec{
		Template: corev1.PodTemplateSpec{
			Spec: corev1.PodSpec{
				Containers: []*corev1.Container{
					{Name: "web"},
				},
			},
		},
	},
}
)");
  ASSERT_TRUE(file);
  rules::extractDeepNesting(*file);
  EXPECT_NE(print(*file).find("var deepNested1 = &corev1.Container{Name: \"web\"}"),
            std::string::npos);
}

TEST(StructuralRulesTest, FileSizeLimit) {
  std::string decls;
  for (int i = 0; i < 21; ++i)
    decls += "var cm" + std::to_string(i) + " = &corev1.ConfigMap{}\n";
  decls += "var helper = mypkg.Thing{}\n";
  auto issues = test::runRule("WK8401", test::manifest(decls));
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].message,
            "File contains 21 resources (max 20), consider splitting into smaller files");
  EXPECT_EQ(issues[0].line, 1u);
  EXPECT_EQ(issues[0].column, 1u);
}

TEST(StructuralRulesTest, TwentyResourcesAreAllowed) {
  std::string decls;
  for (int i = 0; i < 20; ++i) decls += "var cm" + std::to_string(i) + " = corev1.ConfigMap{}\n";
  EXPECT_TRUE(test::runRule("WK8401", test::manifest(decls)).empty());
}
