#pragma once
#include "analyzers/Rule.hpp"
#include "syntax/Visitor.hpp"
#include "llvm/ADT/Twine.h"

namespace kwl {

// Turns rule findings into Issues stamped with the rule's id, severity
// and the file's path.
class IssueReporter {
public:
  IssueReporter(const syntax::SourceFile& file, llvm::StringRef ruleId, Severity severity,
                std::vector<Issue>& out)
    : file_(file), ruleId_(ruleId), severity_(severity), out_(out) {}

  void report(unsigned offset, const llvm::Twine& message);
  void report(const syntax::Expr* at, const llvm::Twine& message);
  void reportAt(unsigned line, unsigned column, const llvm::Twine& message);

  const syntax::SourceFile& file() const { return file_; }

private:
  const syntax::SourceFile& file_;
  llvm::StringRef ruleId_;
  Severity severity_;
  std::vector<Issue>& out_;
};

namespace rules {

// Calls fn(name, value) for every package-level `var` binding with an
// initializer, in declaration order.
template <typename Fn>
void forEachTopLevelVar(const syntax::SourceFile& file, Fn fn) {
  for (const auto& decl : file.decls) {
    const auto* vd = llvm::dyn_cast<syntax::ValueDecl>(decl.get());
    if (!vd || vd->isConst) continue;
    for (const auto& spec : vd->specs) {
      for (size_t i = 0; i < spec.names.size(); ++i) {
        const syntax::Expr* value = spec.valueFor(i);
        if (value && spec.names[i].name != "_") fn(spec.names[i], value);
      }
    }
  }
}

// Calls fn(lit) for every composite literal anywhere in the file.
template <typename Fn>
void forEachComposite(const syntax::SourceFile& file, Fn fn) {
  syntax::forEachExpr(file, [&](const syntax::Expr& e) {
    if (const auto* lit = llvm::dyn_cast<syntax::CompositeLit>(&e)) fn(*lit);
  });
}

// Mutable counterpart of forEachComposite.
template <typename Fn>
void forEachMutableComposite(syntax::SourceFile& file, Fn fn) {
  syntax::forEachMutableExpr(file, [&](syntax::Expr& e) {
    if (auto* lit = llvm::dyn_cast<syntax::CompositeLit>(&e)) fn(*lit);
  });
}

constexpr unsigned kMaxNestingDepth = 5;
constexpr unsigned kExtractionDepth = 4;
constexpr unsigned kMaxResourcesPerFile = 20;

// Structural
void checkTopLevelResources(const syntax::SourceFile& file, IssueReporter& r);    // WK8001
void checkNestingDepth(const syntax::SourceFile& file, IssueReporter& r);         // WK8002
std::vector<FixResult> extractDeepNesting(syntax::SourceFile& file);              // WK8002 fix
void checkFileSize(const syntax::SourceFile& file, IssueReporter& r);             // WK8401
unsigned nestingDepth(const syntax::Expr* e);

// Uniqueness and dependency graph
void checkDuplicateNames(const syntax::SourceFile& file, IssueReporter& r);       // WK8003
void checkCircularDependencies(const syntax::SourceFile& file, IssueReporter& r); // WK8004

// Security
void checkEnvSecrets(const syntax::SourceFile& file, IssueReporter& r);           // WK8005
void checkTokenPatterns(const syntax::SourceFile& file, IssueReporter& r);        // WK8041
void checkPrivateKeys(const syntax::SourceFile& file, IssueReporter& r);          // WK8042
void checkPrivileged(const syntax::SourceFile& file, IssueReporter& r);           // WK8202
void checkReadOnlyRootFilesystem(const syntax::SourceFile& file, IssueReporter& r); // WK8203
void checkRunAsNonRoot(const syntax::SourceFile& file, IssueReporter& r);         // WK8204
void checkDropCapabilities(const syntax::SourceFile& file, IssueReporter& r);     // WK8205
void checkHostNetwork(const syntax::SourceFile& file, IssueReporter& r);          // WK8207
void checkHostPID(const syntax::SourceFile& file, IssueReporter& r);              // WK8208
void checkHostIPC(const syntax::SourceFile& file, IssueReporter& r);              // WK8209

// Containers
void checkLatestTags(const syntax::SourceFile& file, IssueReporter& r);           // WK8006
void checkContainerNames(const syntax::SourceFile& file, IssueReporter& r);       // WK8103
void checkPortNames(const syntax::SourceFile& file, IssueReporter& r);            // WK8104
void checkImagePullPolicy(const syntax::SourceFile& file, IssueReporter& r);      // WK8105
std::vector<FixResult> injectImagePullPolicy(syntax::SourceFile& file);           // WK8105 fix
void checkResourceLimits(const syntax::SourceFile& file, IssueReporter& r);       // WK8201
void checkHealthProbes(const syntax::SourceFile& file, IssueReporter& r);         // WK8301
std::string defaultPullPolicy(llvm::StringRef image);

// Workloads
void checkSelectorLabels(const syntax::SourceFile& file, IssueReporter& r);       // WK8101
void checkMissingLabels(const syntax::SourceFile& file, IssueReporter& r);        // WK8102

// Availability
void checkReplicas(const syntax::SourceFile& file, IssueReporter& r);             // WK8302
void checkDisruptionBudget(const syntax::SourceFile& file, IssueReporter& r);     // WK8303
void checkAntiAffinity(const syntax::SourceFile& file, IssueReporter& r);         // WK8304

} // namespace rules
} // namespace kwl
