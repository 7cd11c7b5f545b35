#pragma once
#include "analyzers/Issue.hpp"
#include "syntax/Ast.hpp"
#include "llvm/ADT/StringSet.h"
#include <functional>
#include <string>
#include <vector>

namespace kwl {

struct Config {
  llvm::StringSet<> disabledRules;
  Severity minSeverity = Severity::Info;

  bool isDisabled(llvm::StringRef ruleId) const { return disabledRules.contains(ruleId); }
  bool admits(Severity s) const { return s <= minSeverity; }
};

// Checks never mutate the tree; fixes do, and only when invoked.
using CheckFn = std::function<std::vector<Issue>(const syntax::SourceFile&)>;
using FixFn = std::function<std::vector<FixResult>(syntax::SourceFile&)>;

struct Rule {
  std::string id;
  std::string name;
  std::string description;
  Severity severity = Severity::Warning;
  CheckFn check;
  FixFn fix;               // empty when the rule has no automated fix

  bool fixable() const { return static_cast<bool>(fix); }
};

} // namespace kwl
