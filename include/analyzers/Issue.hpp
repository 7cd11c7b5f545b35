#pragma once
#include "llvm/ADT/StringRef.h"
#include <optional>
#include <string>
#include <vector>

namespace kwl {

// Lower is more severe. A threshold admits issues numerically <= it.
enum class Severity { Error = 0, Warning = 1, Info = 2 };

llvm::StringRef severityName(Severity s);
std::optional<Severity> parseSeverity(llvm::StringRef name);

struct Issue {
  std::string ruleId;         // eg. "WK8105"
  std::string message;
  std::string file;
  unsigned    line = 0;
  unsigned    column = 0;
  Severity    severity = Severity::Warning;
};

// Outcome of one applied or attempted fix.
struct FixResult {
  std::string file;
  std::string ruleId;
  bool        fixed = false;
  std::string description;
  std::string error;          // set when fixed is false
};

// Aggregate of a run, computed by counting.
struct LintResult {
  std::vector<Issue> issues;
  unsigned totalFiles = 0;
  unsigned filesWithIssues = 0;
  unsigned errorCount = 0;
  unsigned warningCount = 0;
  unsigned infoCount = 0;

  void add(std::vector<Issue> fileIssues);
};

} // namespace kwl
