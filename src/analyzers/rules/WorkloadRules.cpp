#include "analyzers/Matchers.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/FormatVariadic.h"

using namespace kwl::syntax;

namespace kwl {
namespace rules {

static bool hasSelector(llvm::StringRef kind) {
  return kind == "Deployment" || kind == "StatefulSet" || kind == "DaemonSet";
}

static bool isLabelledKind(llvm::StringRef kind) {
  return llvm::StringSwitch<bool>(kind)
    .Cases("Deployment", "Service", "Pod", "ConfigMap", "Secret", true)
    .Cases("StatefulSet", "DaemonSet", "Ingress", "Job", "CronJob", true)
    .Default(false);
}

void checkSelectorLabels(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!hasSelector(match::typeNameOf(&lit))) return;

    const CompositeLit* selector = match::fieldPath(&lit, {"Spec", "Selector"});
    auto selectorLabels = match::mapLiteral(match::fieldValue(selector, "MatchLabels"));
    const CompositeLit* templ = match::fieldPath(&lit, {"Spec", "Template"});
    auto templateLabels = match::mapLiteral(match::fieldValue(match::metadataOf(templ), "Labels"));
    if (selectorLabels.empty() || templateLabels.empty()) return;

    for (const auto& kv : selectorLabels) {
      auto it = templateLabels.find(kv.first);
      if (it == templateLabels.end()) {
        r.report(&lit, llvm::formatv("Selector label {0} not found in template labels",
                                     match::quote(kv.first))
                           .str());
      } else if (!kv.second.empty() && !it->second.empty() && kv.second != it->second) {
        r.report(&lit, llvm::formatv("Selector label {0} has value {1} but template has {2}",
                                     match::quote(kv.first), match::quote(kv.second),
                                     match::quote(it->second))
                           .str());
      }
    }
  });
}

void checkMissingLabels(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    llvm::StringRef kind = match::typeNameOf(&lit);
    if (!isLabelledKind(kind)) return;
    const auto* labels = match::compositeOf(match::fieldValue(match::metadataOf(&lit), "Labels"));
    if (labels && !labels->elements.empty()) return;
    r.report(&lit, kind + " should have metadata labels for better organization");
  });
}

} // namespace rules
} // namespace kwl
