#pragma once
#include "analyzers/Issue.hpp"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kwl {

class RuleRegistry;

enum class OutputFormat { Text, Json, GitHub };

std::optional<OutputFormat> parseOutputFormat(llvm::StringRef name);

class Formatter {
public:
  virtual ~Formatter() = default;
  virtual void format(const LintResult& result, llvm::raw_ostream& os) const = 0;
};

class TextFormatter : public Formatter {
public:
  void format(const LintResult& result, llvm::raw_ostream& os) const override;
};

class JsonFormatter : public Formatter {
public:
  void format(const LintResult& result, llvm::raw_ostream& os) const override;
};

// GitHub Actions workflow annotations.
class GitHubFormatter : public Formatter {
public:
  void format(const LintResult& result, llvm::raw_ostream& os) const override;
};

std::unique_ptr<Formatter> makeFormatter(OutputFormat format);

// Issues ordered by file, line, column, then rule.
std::vector<Issue> sortedIssues(const std::vector<Issue>& issues);

struct RuleSummary {
  std::string ruleId;
  unsigned count = 0;
  Severity severity = Severity::Warning;
  std::string description;
};

// Per-rule issue counts, ordered by rule ID.
std::vector<RuleSummary> summarizeByRule(const std::vector<Issue>& issues,
                                         const RuleRegistry& registry);

} // namespace kwl
