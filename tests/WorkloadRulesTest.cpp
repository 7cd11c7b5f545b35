#include "TestUtil.hpp"
#include <gtest/gtest.h>

using namespace kwl;

namespace {

// A Deployment with the given selector labels, template labels and
// replicas expression ("" leaves Replicas unset).
std::string deployment(const std::string& selector, const std::string& templ,
                       const std::string& replicas, const std::string& extraPodSpec = "") {
  std::string out = "var deploy = &appsv1.Deployment{\n"
                    "\tObjectMeta: metav1.ObjectMeta{Name: \"web\", Labels: map[string]string{\"app\": \"web\"}},\n"
                    "\tSpec: appsv1.DeploymentSpec{\n";
  if (!replicas.empty()) out += "\t\tReplicas: " + replicas + ",\n";
  out += "\t\tSelector: &metav1.LabelSelector{MatchLabels: map[string]string{" + selector + "}},\n"
         "\t\tTemplate: corev1.PodTemplateSpec{\n"
         "\t\t\tObjectMeta: metav1.ObjectMeta{Labels: map[string]string{" + templ + "}},\n"
         "\t\t\tSpec: corev1.PodSpec{" + extraPodSpec + "},\n"
         "\t\t},\n"
         "\t},\n"
         "}\n";
  return out;
}

} // namespace

TEST(SelectorLabelsTest, MatchingLabelsPass) {
  auto issues = test::runRule("WK8101", test::manifest(deployment(
      "\"app\": \"web\"", "\"app\": \"web\", \"tier\": \"frontend\"", "int32Ptr(3)")));
  EXPECT_TRUE(issues.empty());
}

TEST(SelectorLabelsTest, MissingAndMismatchedKeys) {
  auto issues = test::runRule("WK8101", test::manifest(deployment(
      "\"app\": \"web\", \"tier\": \"frontend\"", "\"app\": \"api\"", "3")));
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(issues[0].message, "Selector label \"app\" has value \"web\" but template has \"api\"");
  EXPECT_EQ(issues[1].message, "Selector label \"tier\" not found in template labels");
  EXPECT_EQ(issues[0].line, 3u);
  EXPECT_EQ(issues[0].column, 15u);
  EXPECT_EQ(issues[0].severity, Severity::Error);
}

TEST(SelectorLabelsTest, EmptyTemplateLabelsAreSkipped) {
  auto issues = test::runRule("WK8101", test::manifest(deployment("\"app\": \"web\"", "", "3")));
  EXPECT_TRUE(issues.empty());
}

TEST(MissingLabelsTest, ResourcesNeedLabels) {
  auto issues = test::runRule("WK8102", test::manifest(R"(var svc = corev1.Service{ObjectMeta: metav1.ObjectMeta{Name: "web"}}
var cm = corev1.ConfigMap{ObjectMeta: metav1.ObjectMeta{Name: "cfg", Labels: map[string]string{"app": "web"}}}
var pvc = corev1.PersistentVolumeClaim{}
var job = batchv1.Job{}
)"));
  ASSERT_EQ(issues.size(), 2u);
  EXPECT_EQ(issues[0].message, "Service should have metadata labels for better organization");
  EXPECT_EQ(issues[1].message, "Job should have metadata labels for better organization");
  EXPECT_EQ(issues[1].line, 6u);
}

TEST(ReplicasTest, UnsetAndLowReplicas) {
  auto unset = test::runRule("WK8302", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "")));
  ASSERT_EQ(unset.size(), 1u);
  EXPECT_EQ(unset[0].message,
            "Deployment should explicitly set replicas >= 2 for high availability");
  EXPECT_EQ(unset[0].severity, Severity::Info);

  auto single = test::runRule("WK8302", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "int32Ptr(1)")));
  ASSERT_EQ(single.size(), 1u);
  EXPECT_EQ(single[0].message, "Deployment should have at least 2 replicas for high availability");

  EXPECT_TRUE(test::runRule("WK8302", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "int32Ptr(2)"))).empty());

  auto negative = test::runRule("WK8302", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "ptr.To[int32](-1)")));
  ASSERT_EQ(negative.size(), 1u);
  EXPECT_EQ(negative[0].message, "Deployment should have at least 2 replicas for high availability");
}

TEST(DisruptionBudgetTest, HaDeploymentNeedsMatchingBudget) {
  std::string deploy = deployment("\"app\": \"web\"", "\"app\": \"web\"", "3");
  auto missing = test::runRule("WK8303", test::manifest(deploy));
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0].message, "HA deployment (replicas >= 2) should have a PodDisruptionBudget");

  std::string pdb = R"(var pdb = policyv1.PodDisruptionBudget{
	Spec: policyv1.PodDisruptionBudgetSpec{
		Selector: &metav1.LabelSelector{MatchLabels: map[string]string{"app": "web"}},
	},
}
)";
  EXPECT_TRUE(test::runRule("WK8303", test::manifest(deploy + pdb)).empty());

  std::string otherPdb = R"(var pdb = policyv1.PodDisruptionBudget{
	Spec: policyv1.PodDisruptionBudgetSpec{
		Selector: &metav1.LabelSelector{MatchLabels: map[string]string{"app": "db"}},
	},
}
)";
  EXPECT_EQ(test::runRule("WK8303", test::manifest(deploy + otherPdb)).size(), 1u);
}

TEST(DisruptionBudgetTest, SingleReplicaIsExempt) {
  EXPECT_TRUE(test::runRule("WK8303", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "1"))).empty());
}

TEST(AntiAffinityTest, HaDeploymentNeedsPodAntiAffinity) {
  auto missing = test::runRule("WK8304", test::manifest(deployment("\"app\": \"web\"", "\"app\": \"web\"", "2")));
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0].message,
            "HA deployment (replicas >= 2) should use pod anti-affinity to spread across nodes");

  auto present = test::runRule("WK8304", test::manifest(deployment(
      "\"app\": \"web\"", "\"app\": \"web\"", "2",
      "Affinity: &corev1.Affinity{PodAntiAffinity: &corev1.PodAntiAffinity{}}")));
  EXPECT_TRUE(present.empty());
}
