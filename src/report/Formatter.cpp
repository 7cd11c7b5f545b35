#include "report/Formatter.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/JSON.h"
#include <algorithm>
#include <map>
#include <tuple>

namespace kwl {

std::optional<OutputFormat> parseOutputFormat(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<OutputFormat>>(name)
    .Case("text", OutputFormat::Text)
    .Case("json", OutputFormat::Json)
    .Case("github", OutputFormat::GitHub)
    .Default(std::nullopt);
}

std::vector<Issue> sortedIssues(const std::vector<Issue>& issues) {
  std::vector<Issue> sorted = issues;
  std::stable_sort(sorted.begin(), sorted.end(), [](const Issue& a, const Issue& b) {
    return std::tie(a.file, a.line, a.column, a.ruleId) <
           std::tie(b.file, b.line, b.column, b.ruleId);
  });
  return sorted;
}

void TextFormatter::format(const LintResult& result, llvm::raw_ostream& os) const {
  if (result.issues.empty()) {
    os << "No issues found.\n";
    return;
  }
  for (const Issue& i : sortedIssues(result.issues)) {
    os << i.file << ":" << i.line << ":" << i.column << ": " << severityName(i.severity)
       << " [" << i.ruleId << "] " << i.message << "\n";
  }

  os << "\nFound " << result.issues.size() << " issue(s) in " << result.filesWithIssues
     << " file(s):\n";
  if (result.errorCount) os << "  - " << result.errorCount << " error(s)\n";
  if (result.warningCount) os << "  - " << result.warningCount << " warning(s)\n";
  if (result.infoCount) os << "  - " << result.infoCount << " info\n";
}

// json::Value requires valid UTF-8; messages may quote arbitrary file bytes.
static std::string jsonText(const std::string& s) {
  return llvm::json::isUTF8(s) ? s : llvm::json::fixUTF8(s);
}

void JsonFormatter::format(const LintResult& result, llvm::raw_ostream& os) const {
  llvm::json::OStream j(os, 2);
  j.object([&] {
    j.attributeArray("issues", [&] {
      for (const Issue& i : sortedIssues(result.issues)) {
        j.object([&] {
          j.attribute("rule", i.ruleId);
          j.attribute("message", jsonText(i.message));
          j.attribute("file", jsonText(i.file));
          j.attribute("line", (int64_t)i.line);
          j.attribute("column", (int64_t)i.column);
          j.attribute("severity", severityName(i.severity));
        });
      }
    });
    j.attribute("total_files", (int64_t)result.totalFiles);
    j.attribute("files_with_issues", (int64_t)result.filesWithIssues);
    j.attribute("error_count", (int64_t)result.errorCount);
    j.attribute("warning_count", (int64_t)result.warningCount);
    j.attribute("info_count", (int64_t)result.infoCount);
  });
  os << "\n";
}

static llvm::StringRef annotationLevel(Severity s) {
  switch (s) {
  case Severity::Error: return "error";
  case Severity::Warning: return "warning";
  case Severity::Info: return "notice";
  }
  return "notice";
}

void GitHubFormatter::format(const LintResult& result, llvm::raw_ostream& os) const {
  if (result.issues.empty()) {
    os << "No issues found.\n";
    return;
  }
  for (const Issue& i : sortedIssues(result.issues)) {
    os << "::" << annotationLevel(i.severity) << " file=" << i.file << ",line=" << i.line
       << ",col=" << i.column << ",title=" << i.ruleId << "::" << i.message << "\n";
  }
  os << "\nFound " << result.issues.size() << " issue(s) in " << result.filesWithIssues
     << " file(s)\n";
}

std::unique_ptr<Formatter> makeFormatter(OutputFormat format) {
  switch (format) {
  case OutputFormat::Json: return std::make_unique<JsonFormatter>();
  case OutputFormat::GitHub: return std::make_unique<GitHubFormatter>();
  case OutputFormat::Text: break;
  }
  return std::make_unique<TextFormatter>();
}

std::vector<RuleSummary> summarizeByRule(const std::vector<Issue>& issues,
                                         const RuleRegistry& registry) {
  std::map<std::string, unsigned> counts;
  for (const Issue& i : issues) ++counts[i.ruleId];

  std::vector<RuleSummary> summary;
  for (const auto& entry : counts) {
    RuleSummary s;
    s.ruleId = entry.first;
    s.count = entry.second;
    if (const Rule* rule = registry.find(entry.first)) {
      s.severity = rule->severity;
      s.description = rule->description;
    }
    summary.push_back(std::move(s));
  }
  return summary;
}

} // namespace kwl
