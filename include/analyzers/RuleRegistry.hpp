#pragma once
#include "analyzers/Rule.hpp"
#include "llvm/ADT/StringMap.h"
#include <string>
#include <vector>

namespace kwl {

// The rule catalog, ordered by rule ID.
class RuleRegistry {
public:
  void add(Rule rule);

  const std::vector<Rule>& allRules() const { return rules_; }
  const Rule* find(llvm::StringRef id) const;
  std::vector<std::string> fixableRuleIds() const;

  // Rules neither disabled nor filtered out by the severity threshold.
  std::vector<const Rule*> enabledRules(const Config& config) const;

private:
  std::vector<Rule> rules_;
  llvm::StringMap<size_t> index_;
};

// Built once on first use.
const RuleRegistry& defaultRuleRegistry();

} // namespace kwl
