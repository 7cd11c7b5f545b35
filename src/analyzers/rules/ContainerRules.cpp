#include "analyzers/Matchers.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/Support/FormatVariadic.h"

using namespace kwl::syntax;

namespace kwl {
namespace rules {

namespace {

bool isContainer(const CompositeLit& lit) { return match::isShape(&lit, "Container"); }

// An image without a tag or digest resolves to :latest.
bool usesLatestTag(llvm::StringRef image) {
  return image.endswith(":latest") || (!image.contains(':') && !image.contains('@'));
}

// A Name field counts when it is a non-empty literal or any computed value.
bool hasName(const CompositeLit& lit) {
  const Expr* name = match::fieldValue(&lit, "Name");
  if (!name) return false;
  std::optional<std::string> s = match::stringLiteral(name);
  return !s || !s->empty();
}

std::optional<std::string> imageOf(const CompositeLit& container) {
  std::optional<std::string> image = match::stringLiteral(match::fieldValue(&container, "Image"));
  if (!image || image->empty()) return std::nullopt;
  return image;
}

bool needsPullPolicy(const CompositeLit& container) {
  return imageOf(container) && !match::field(&container, "ImagePullPolicy");
}

} // namespace

std::string defaultPullPolicy(llvm::StringRef image) {
  return usesLatestTag(image) ? "Always" : "IfNotPresent";
}

void checkLatestTags(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isContainer(lit)) return;
    const Expr* imageExpr = match::fieldValue(&lit, "Image");
    std::optional<std::string> image = match::stringLiteral(imageExpr);
    if (!image || image->empty() || !usesLatestTag(*image)) return;
    r.report(imageExpr, llvm::formatv("Image {0} uses :latest tag or no tag (defaults to :latest), "
                                      "specify a version tag",
                                      match::quote(*image))
                            .str());
  });
}

void checkContainerNames(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (isContainer(lit) && !hasName(lit)) r.report(&lit, "Container must have a Name field");
  });
}

void checkPortNames(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    llvm::StringRef type = match::typeNameOf(&lit);
    if (type != "ContainerPort" && type != "ServicePort") return;
    if (hasName(lit)) return;
    r.report(&lit, type + " should have a Name for better documentation and service mesh support");
  });
}

void checkImagePullPolicy(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isContainer(lit) || !needsPullPolicy(lit)) return;
    r.report(&lit, llvm::formatv("Container with image {0} should have explicit ImagePullPolicy",
                                 match::quote(*imageOf(lit)))
                       .str());
  });
}

std::vector<FixResult> injectImagePullPolicy(SourceFile& file) {
  // Collect first; the insertions below reshape the element lists the
  // traversal walks.
  std::vector<CompositeLit*> targets;
  forEachMutableComposite(file, [&](CompositeLit& lit) {
    if (isContainer(lit) && needsPullPolicy(lit)) targets.push_back(&lit);
  });

  std::vector<FixResult> results;
  for (CompositeLit* container : targets) {
    std::string image = *imageOf(*container);
    std::string policy = defaultPullPolicy(image);

    auto entry = std::make_unique<KeyValueExpr>(
        std::make_unique<Ident>("ImagePullPolicy"),
        std::make_unique<BasicLit>(LitKind::String, match::quote(policy)));
    const KeyValueExpr* anchor = match::field(container, "Image");
    unsigned line = file.position(container->range.begin).line;
    container->insertElementAfter(anchor, std::move(entry));

    FixResult fr;
    fr.file = file.path;
    fr.ruleId = "WK8105";
    fr.fixed = true;
    fr.description = llvm::formatv("Added ImagePullPolicy: {0} for image {1} at line {2}",
                                   match::quote(policy), match::quote(image), line)
                         .str();
    results.push_back(std::move(fr));
  }
  return results;
}

void checkResourceLimits(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isContainer(lit)) return;
    const CompositeLit* resources = match::fieldRecord(&lit, "Resources");
    const auto* limits =
        llvm::dyn_cast_or_null<CompositeLit>(match::fieldValue(resources, "Limits"));
    if (limits && !limits->elements.empty()) return;
    r.report(&lit, "Container should have resource limits (cpu, memory) to prevent resource "
                   "exhaustion");
  });
}

void checkHealthProbes(const SourceFile& file, IssueReporter& r) {
  forEachComposite(file, [&](const CompositeLit& lit) {
    if (!isContainer(lit)) return;
    bool liveness = match::field(&lit, "LivenessProbe") != nullptr;
    bool readiness = match::field(&lit, "ReadinessProbe") != nullptr;
    if (liveness && readiness) return;

    std::string missing;
    if (!liveness) missing = "liveness";
    if (!readiness) missing += missing.empty() ? "readiness" : " and readiness";
    r.report(&lit, llvm::formatv("Container should have {0} probe(s) for automatic failure "
                                 "detection",
                                 missing)
                       .str());
  });
}

} // namespace rules
} // namespace kwl
