#include "analyzers/Matchers.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/ADT/StringSet.h"
#include <optional>

using namespace kwl::syntax;

namespace kwl {
namespace rules {

namespace {

constexpr int64_t kMinReplicas = 2;

bool isDeployment(const CompositeLit& lit) { return match::isShape(&lit, "Deployment"); }

// Null when Replicas is unset or not a literal.
std::optional<int64_t> replicasOf(const CompositeLit& deployment) {
  return match::intLiteral(match::fieldValue(match::fieldRecord(&deployment, "Spec"), "Replicas"));
}

// An unset replica count defaults to 1.
bool isHighlyAvailable(const CompositeLit& deployment) {
  return replicasOf(deployment).value_or(1) >= kMinReplicas;
}

std::map<std::string, std::string> selectorLabelsOf(const CompositeLit& lit) {
  return match::mapLiteral(
      match::fieldValue(match::fieldPath(&lit, {"Spec", "Selector"}), "MatchLabels"));
}

} // namespace

void checkReplicas(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isDeployment(lit)) return;
    std::optional<int64_t> replicas = replicasOf(lit);
    if (replicas && *replicas >= kMinReplicas) return;
    if (!replicas)
      r.report(&lit, "Deployment should explicitly set replicas >= 2 for high availability");
    else
      r.report(&lit, "Deployment should have at least 2 replicas for high availability");
  });
}

void checkDisruptionBudget(const SourceFile& file, IssueReporter& r) {
  llvm::StringSet<> covered;
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!match::isShape(&lit, "PodDisruptionBudget")) return;
    for (const auto& kv : selectorLabelsOf(lit)) covered.insert(kv.first + "=" + kv.second);
  });

  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isDeployment(lit) || !isHighlyAvailable(lit)) return;
    auto selector = selectorLabelsOf(lit);
    if (selector.empty()) return;
    for (const auto& kv : selector)
      if (covered.contains(kv.first + "=" + kv.second)) return;
    r.report(&lit, "HA deployment (replicas >= 2) should have a PodDisruptionBudget");
  });
}

void checkAntiAffinity(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isDeployment(lit) || !isHighlyAvailable(lit)) return;
    const CompositeLit* affinity = match::fieldPath(&lit, {"Spec", "Template", "Spec", "Affinity"});
    if (match::field(affinity, "PodAntiAffinity")) return;
    r.report(&lit, "HA deployment (replicas >= 2) should use pod anti-affinity to spread across "
                   "nodes");
  });
}

} // namespace rules
} // namespace kwl
