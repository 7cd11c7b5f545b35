#include "analyzers/RuleRegistry.hpp"
#include "analyzers/Rules.hpp"
#include <algorithm>

namespace kwl {

void RuleRegistry::add(Rule rule) {
  auto pos = std::lower_bound(rules_.begin(), rules_.end(), rule.id,
                              [](const Rule& r, const std::string& id) { return r.id < id; });
  rules_.insert(pos, std::move(rule));
  index_.clear();
  for (size_t i = 0; i < rules_.size(); ++i) index_[rules_[i].id] = i;
}

const Rule* RuleRegistry::find(llvm::StringRef id) const {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &rules_[it->second];
}

std::vector<std::string> RuleRegistry::fixableRuleIds() const {
  std::vector<std::string> ids;
  for (const Rule& r : rules_)
    if (r.fixable()) ids.push_back(r.id);
  return ids;
}

std::vector<const Rule*> RuleRegistry::enabledRules(const Config& config) const {
  std::vector<const Rule*> out;
  for (const Rule& r : rules_)
    if (!config.isDisabled(r.id) && config.admits(r.severity)) out.push_back(&r);
  return out;
}

namespace {

using CheckImpl = void (*)(const syntax::SourceFile&, IssueReporter&);

Rule makeRule(std::string id, std::string name, std::string description, Severity severity,
              CheckImpl impl, FixFn fix = nullptr) {
  Rule rule;
  rule.id = id;
  rule.name = std::move(name);
  rule.description = std::move(description);
  rule.severity = severity;
  rule.check = [id, severity, impl](const syntax::SourceFile& file) {
    std::vector<Issue> out;
    IssueReporter reporter(file, id, severity, out);
    impl(file, reporter);
    return out;
  };
  rule.fix = std::move(fix);
  return rule;
}

RuleRegistry buildDefaultRegistry() {
  using namespace rules;
  RuleRegistry reg;
  const Severity E = Severity::Error, W = Severity::Warning, I = Severity::Info;

  // Structure and graph
  reg.add(makeRule("WK8001", "Top-level resource declarations",
                   "Resources should be declared as top-level composite literals", E,
                   checkTopLevelResources));
  reg.add(makeRule("WK8002", "Avoid deeply nested structures (max depth 5)",
                   "Nested structures deeper than 5 levels should be extracted into variables", W,
                   checkNestingDepth, extractDeepNesting));
  reg.add(makeRule("WK8003", "No duplicate resource names",
                   "Resource names must be unique within a namespace", E, checkDuplicateNames));
  reg.add(makeRule("WK8004", "Circular dependency detection",
                   "Resources must not reference each other in a cycle", E,
                   checkCircularDependencies));
  reg.add(makeRule("WK8401", "File size limits", "Files should not exceed 20 resources", W,
                   checkFileSize));

  // Security
  reg.add(makeRule("WK8005", "Flag hardcoded secrets", "Flag hardcoded secrets in env vars", E,
                   checkEnvSecrets));
  reg.add(makeRule("WK8041", "Hardcoded API keys/tokens", "Hardcoded API keys/tokens detected", E,
                   checkTokenPatterns));
  reg.add(makeRule("WK8042", "Private key headers", "Private key headers detected in ConfigMap", E,
                   checkPrivateKeys));
  reg.add(makeRule("WK8202", "Privileged containers",
                   "Containers should not run in privileged mode", E, checkPrivileged));
  reg.add(makeRule("WK8203", "ReadOnlyRootFilesystem",
                   "Containers should set ReadOnlyRootFilesystem: true", W,
                   checkReadOnlyRootFilesystem));
  reg.add(makeRule("WK8204", "RunAsNonRoot", "Containers should set RunAsNonRoot: true", W,
                   checkRunAsNonRoot));
  reg.add(makeRule("WK8205", "Drop capabilities",
                   "Containers should drop unnecessary Linux capabilities", W,
                   checkDropCapabilities));
  reg.add(makeRule("WK8207", "No host network", "Pods should not use HostNetwork: true", W,
                   checkHostNetwork));
  reg.add(makeRule("WK8208", "No host PID", "Pods should not use HostPID: true", W, checkHostPID));
  reg.add(makeRule("WK8209", "No host IPC", "Pods should not use HostIPC: true", W, checkHostIPC));

  // Containers
  reg.add(makeRule("WK8006", "Flag :latest image tags",
                   "Images should be pinned to a version tag instead of :latest", E,
                   checkLatestTags));
  reg.add(makeRule("WK8103", "Container name required", "All containers must have a Name field", E,
                   checkContainerNames));
  reg.add(makeRule("WK8104", "Port name recommended",
                   "Container and Service ports should be named", W, checkPortNames));
  reg.add(makeRule("WK8105", "ImagePullPolicy explicit",
                   "ImagePullPolicy should be explicitly set", W, checkImagePullPolicy,
                   injectImagePullPolicy));
  reg.add(makeRule("WK8201", "Missing resource limits", "Containers should have resource limits",
                   W, checkResourceLimits));
  reg.add(makeRule("WK8301", "Missing health probes",
                   "Containers should have liveness and readiness probes", W, checkHealthProbes));

  // Workloads and availability
  reg.add(makeRule("WK8101", "Selector label mismatch",
                   "Deployment selector labels must match template labels", E,
                   checkSelectorLabels));
  reg.add(makeRule("WK8102", "Missing labels", "Resources should have metadata labels", W,
                   checkMissingLabels));
  reg.add(makeRule("WK8302", "Replicas minimum",
                   "Deployments should have at least 2 replicas for high availability", I,
                   checkReplicas));
  reg.add(makeRule("WK8303", "PodDisruptionBudget",
                   "HA deployments should have a PodDisruptionBudget", I, checkDisruptionBudget));
  reg.add(makeRule("WK8304", "Anti-affinity recommended",
                   "HA deployments should use pod anti-affinity", I, checkAntiAffinity));
  return reg;
}

} // namespace

const RuleRegistry& defaultRuleRegistry() {
  static const RuleRegistry registry = buildDefaultRegistry();
  return registry;
}

} // namespace kwl
