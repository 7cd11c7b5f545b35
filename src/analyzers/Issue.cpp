#include "analyzers/Issue.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/ADT/StringSwitch.h"

namespace kwl {

llvm::StringRef severityName(Severity s) {
  switch (s) {
  case Severity::Error: return "error";
  case Severity::Warning: return "warning";
  case Severity::Info: return "info";
  }
  return "info";
}

std::optional<Severity> parseSeverity(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<Severity>>(name.lower())
    .Case("error", Severity::Error)
    .Case("warning", Severity::Warning)
    .Case("info", Severity::Info)
    .Default(std::nullopt);
}

void LintResult::add(std::vector<Issue> fileIssues) {
  if (fileIssues.empty()) return;
  ++filesWithIssues;
  for (auto& issue : fileIssues) {
    switch (issue.severity) {
    case Severity::Error: ++errorCount; break;
    case Severity::Warning: ++warningCount; break;
    case Severity::Info: ++infoCount; break;
    }
    issues.push_back(std::move(issue));
  }
}

void IssueReporter::report(unsigned offset, const llvm::Twine& message) {
  syntax::Position pos = file_.position(offset);
  reportAt(pos.line, pos.column, message);
}

void IssueReporter::report(const syntax::Expr* at, const llvm::Twine& message) {
  report(at ? at->range.begin : 0, message);
}

void IssueReporter::reportAt(unsigned line, unsigned column, const llvm::Twine& message) {
  Issue issue;
  issue.ruleId = ruleId_.str();
  issue.message = message.str();
  issue.file = file_.path;
  issue.line = line;
  issue.column = column;
  issue.severity = severity_;
  out_.push_back(std::move(issue));
}

} // namespace kwl
