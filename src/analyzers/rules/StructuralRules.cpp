#include "analyzers/Matchers.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/FormatVariadic.h"
#include <algorithm>
#include <optional>

using namespace kwl::syntax;

namespace kwl {
namespace rules {

unsigned nestingDepth(const Expr* e) {
  const CompositeLit* lit = match::compositeOf(e);
  if (!lit) return 0;
  unsigned deepest = 0;
  for (const auto& el : lit->elements) {
    const Expr* child = el.get();
    if (const auto* kv = llvm::dyn_cast<KeyValueExpr>(child)) child = kv->value.get();
    deepest = std::max(deepest, nestingDepth(child));
  }
  return deepest + 1;
}

void checkTopLevelResources(const SourceFile& file, IssueReporter& r) {
  forEachTopLevelVar(file, [&](const DeclName& name, const Expr* value) {
    const Expr* target = value;
    if (const auto* un = llvm::dyn_cast<UnaryExpr>(target)) {
      if (un->op == "&") target = un->operand.get();
    }
    if (!llvm::isa<CallExpr>(target)) return;
    r.report(name.offset,
             llvm::formatv("Resource {0} is assigned from a function call, declare it as a "
                           "top-level composite literal instead",
                           match::quote(name.name))
                 .str());
  });
}

void checkNestingDepth(const SourceFile& file, IssueReporter& r) {
  forEachTopLevelVar(file, [&](const DeclName& name, const Expr* value) {
    unsigned depth = nestingDepth(value);
    if (depth <= kMaxNestingDepth) return;
    r.report(name.offset,
             llvm::formatv("Variable {0} has nesting depth {1} (max {2}), extract nested "
                           "structures into separate variables",
                           match::quote(name.name), depth, kMaxNestingDepth)
                 .str());
  });
}

static bool isApiGroupAlias(llvm::StringRef pkg) {
  return llvm::StringSwitch<bool>(pkg)
    .Cases("appsv1", "corev1", "batchv1", "networkingv1", "rbacv1", true)
    .Cases("storagev1", "autoscalingv1", "autoscalingv2", "policyv1", true)
    .Default(false);
}

void checkFileSize(const SourceFile& file, IssueReporter& r) {
  unsigned count = 0;
  forEachTopLevelVar(file, [&](const DeclName&, const Expr* value) {
    const CompositeLit* lit = match::compositeOf(value);
    if (!lit) return;
    const auto* sel = llvm::dyn_cast_or_null<SelectorExpr>(lit->type.get());
    if (!sel) return;
    const auto* pkg = llvm::dyn_cast<Ident>(sel->base.get());
    if (pkg && isApiGroupAlias(pkg->name)) ++count;
  });
  if (count > kMaxResourcesPerFile) {
    r.reportAt(1, 1, llvm::formatv("File contains {0} resources (max {1}), consider splitting "
                                   "into smaller files",
                                   count, kMaxResourcesPerFile)
                         .str());
  }
}

namespace {

// Hoists literals found at or below kExtractionDepth out of one variable's
// initializer, innermost first.
class NestingExtractor {
public:
  NestingExtractor(std::string parent, llvm::StringSet<>& taken, std::vector<DeclPtr>& out)
    : parent_(std::move(parent)), taken_(taken), out_(out) {}

  void run(Expr* root) { visit(root, 0, ""); }
  unsigned extracted() const { return extracted_; }

private:
  // Returns the variable name when `e` itself should be hoisted; the
  // caller swaps it for a reference.
  std::optional<std::string> visit(Expr* e, unsigned depth, llvm::StringRef fieldName) {
    if (auto* un = llvm::dyn_cast<UnaryExpr>(e)) {
      if (auto name = visit(un->operand.get(), depth, fieldName)) {
        auto ref = std::make_unique<Ident>(*name);
        ref->slot = un->operand->extent();
        ExprPtr old = std::move(un->operand);
        un->operand = std::move(ref);
        un->markEdited();
        hoist(std::move(old), *name);
      }
      return std::nullopt;
    }

    auto* lit = llvm::dyn_cast<CompositeLit>(e);
    if (!lit) return std::nullopt;

    for (size_t i = 0; i < lit->elements.size(); ++i) {
      Expr* el = lit->elements[i].get();
      if (auto* kv = llvm::dyn_cast<KeyValueExpr>(el)) {
        if (auto name = visit(kv->value.get(), depth + 1, kv->keyName()))
          hoist(kv->replaceValue(std::make_unique<Ident>(*name)), *name);
      } else if (auto name = visit(el, depth + 1, "")) {
        hoist(lit->replaceElement(i, std::make_unique<Ident>(*name)), *name);
      }
    }

    if (depth < kExtractionDepth || lit->elements.empty()) return std::nullopt;
    // An elided literal whose type cannot be spelled cannot stand alone.
    if (lit->elided() && lit->impliedType.empty()) return std::nullopt;
    return nextName(fieldName);
  }

  std::string nextName(llvm::StringRef fieldName) {
    std::string name;
    do {
      ++counter_;
      name = parent_ + (fieldName.empty() ? std::string("Nested") : fieldName.str()) +
             std::to_string(counter_);
    } while (taken_.contains(name));
    taken_.insert(name);
    return name;
  }

  void hoist(ExprPtr value, const std::string& name) {
    if (auto* lit = llvm::dyn_cast<CompositeLit>(value.get())) {
      if (lit->elided()) {
        bool pointer = lit->impliedPointer;
        lit->materializeType();
        if (pointer) value = std::make_unique<UnaryExpr>("&", std::move(value));
      }
    }
    out_.push_back(makeVarDecl(name, std::move(value)));
    ++extracted_;
  }

  std::string parent_;
  llvm::StringSet<>& taken_;
  std::vector<DeclPtr>& out_;
  unsigned counter_ = 0;
  unsigned extracted_ = 0;
};

} // namespace

std::vector<FixResult> extractDeepNesting(SourceFile& file) {
  std::vector<FixResult> results;
  llvm::StringSet<> taken;
  for (const auto& decl : file.decls) {
    if (const auto* vd = llvm::dyn_cast<ValueDecl>(decl.get()))
      for (const auto& spec : vd->specs)
        for (const auto& n : spec.names) taken.insert(n.name);
  }

  std::vector<DeclPtr> extracted;
  for (const auto& decl : file.decls) {
    auto* vd = llvm::dyn_cast<ValueDecl>(decl.get());
    if (!vd || vd->isConst || vd->synthesized()) continue;
    for (auto& spec : vd->specs) {
      for (size_t i = 0; i < spec.names.size() && i < spec.values.size(); ++i) {
        const DeclName& name = spec.names[i];
        if (name.name == "_" || nestingDepth(spec.values[i].get()) <= kMaxNestingDepth) continue;

        NestingExtractor extractor(name.name, taken, extracted);
        extractor.run(spec.values[i].get());
        if (!extractor.extracted()) continue;

        FixResult fr;
        fr.file = file.path;
        fr.ruleId = "WK8002";
        fr.fixed = true;
        fr.description = llvm::formatv("Extracted {0} nested structure(s) from {1} at line {2}",
                                       extractor.extracted(), name.name,
                                       file.position(name.offset).line)
                             .str();
        results.push_back(std::move(fr));
      }
    }
  }
  if (extracted.empty()) return results;

  // New declarations go before the first var declaration, else at the end.
  size_t at = file.decls.size();
  for (size_t i = 0; i < file.decls.size(); ++i) {
    const auto* vd = llvm::dyn_cast<ValueDecl>(file.decls[i].get());
    if (vd && !vd->isConst) {
      at = i;
      break;
    }
  }
  for (auto& d : extracted) file.insertDeclBefore(at++, std::move(d));
  return results;
}

} // namespace rules
} // namespace kwl
