#include "analyzers/Analyzer.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "refactor/RefactorEngine.hpp"
#include "report/Formatter.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <optional>

using namespace kwl;

static llvm::cl::OptionCategory ToolCat("kwlint options");

static llvm::cl::opt<std::string> Path(
  llvm::cl::Positional, llvm::cl::desc("[path]"), llvm::cl::init("."),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Format(
  "format", llvm::cl::desc("Output format: text, json or github"),
  llvm::cl::init("text"), llvm::cl::cat(ToolCat));
static llvm::cl::alias FormatShort(
  "f", llvm::cl::desc("Alias for --format"), llvm::cl::aliasopt(Format));

static llvm::cl::opt<std::string> MinSeverity(
  "severity", llvm::cl::desc("Minimum severity to report: error, warning or info"),
  llvm::cl::init("info"), llvm::cl::cat(ToolCat));
static llvm::cl::alias MinSeverityShort(
  "s", llvm::cl::desc("Alias for --severity"), llvm::cl::aliasopt(MinSeverity));

static llvm::cl::list<std::string> Disable(
  "disable", llvm::cl::desc("Rule IDs to disable (comma separated)"),
  llvm::cl::CommaSeparated, llvm::cl::cat(ToolCat));
static llvm::cl::alias DisableShort(
  "d", llvm::cl::desc("Alias for --disable"), llvm::cl::aliasopt(Disable));

static llvm::cl::opt<bool> Fix(
  "fix", llvm::cl::desc("Apply available fixes"), llvm::cl::init(false),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> NoBackup(
  "no-backup", llvm::cl::desc("Do not write .bak backups when applying fixes"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<unsigned> Jobs(
  "jobs", llvm::cl::desc("Worker threads (default: hardware concurrency)"),
  llvm::cl::init(0), llvm::cl::cat(ToolCat));
static llvm::cl::alias JobsShort(
  "j", llvm::cl::desc("Alias for --jobs"), llvm::cl::aliasopt(Jobs));

static llvm::cl::opt<bool> ListRules(
  "list-rules", llvm::cl::desc("List available rules and exit"), llvm::cl::init(false),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Summary(
  "summary", llvm::cl::desc("Print issue counts per rule"), llvm::cl::init(false),
  llvm::cl::cat(ToolCat));

static void printRules(const RuleRegistry& registry, llvm::raw_ostream& os) {
  for (const Rule& rule : registry.allRules()) {
    os << llvm::formatv("{0}  {1,-8} {2}", rule.id, severityName(rule.severity), rule.name);
    if (rule.fixable()) os << " (fixable)";
    os << "\n    " << rule.description << "\n";
  }
}

static void printSummary(const LintResult& result, const RuleRegistry& registry,
                         llvm::raw_ostream& os) {
  if (result.issues.empty()) return;
  os << "\nIssues by rule:\n";
  for (const RuleSummary& s : summarizeByRule(result.issues, registry)) {
    os << llvm::formatv("  {0} ({1}): {2} - {3}\n", s.ruleId, severityName(s.severity), s.count,
                        s.description);
  }
}

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  if (!llvm::cl::ParseCommandLineOptions(
          argc, argv, "Policy linter and auto-fixer for Go Kubernetes declarations\n",
          &llvm::errs()))
    return 2;

  const RuleRegistry& registry = defaultRuleRegistry();
  if (ListRules) {
    printRules(registry, llvm::outs());
    return 0;
  }

  std::optional<OutputFormat> format = parseOutputFormat(Format);
  if (!format) {
    llvm::WithColor::error() << "invalid --format '" << Format
                             << "' (expected text, json or github)\n";
    return 2;
  }
  std::optional<Severity> threshold = parseSeverity(MinSeverity);
  if (!threshold) {
    llvm::WithColor::error() << "invalid --severity '" << MinSeverity
                             << "' (expected error, warning or info)\n";
    return 2;
  }

  Config config;
  config.minSeverity = *threshold;
  for (const auto& id : Disable) {
    llvm::StringRef trimmed = llvm::StringRef(id).trim();
    if (!trimmed.empty()) config.disabledRules.insert(trimmed);
  }

  if (Fix) {
    RefactorOptions fixOpts;
    fixOpts.config = config;
    fixOpts.jobs = Jobs;
    fixOpts.backup = !NoBackup;
    RefactorEngine engine(registry, fixOpts);
    auto fixes = engine.fixPath(Path);
    if (!fixes) {
      llvm::WithColor::error() << llvm::toString(fixes.takeError()) << "\n";
      return 1;
    }
    for (const FixResult& f : *fixes) {
      if (f.fixed)
        llvm::errs() << "fixed [" << f.ruleId << "] " << f.file << ": " << f.description << "\n";
      else
        llvm::WithColor::error() << "[" << f.ruleId << "] " << f.file << ": " << f.error << "\n";
    }
  }

  AnalyzeOptions opts;
  opts.config = config;
  opts.jobs = Jobs;
  auto analyzer = makeManifestAnalyzer(registry, opts);
  auto result = analyzer->analyzePath(Path);
  if (!result) {
    llvm::WithColor::error() << llvm::toString(result.takeError()) << "\n";
    return 1;
  }

  makeFormatter(*format)->format(*result, llvm::outs());
  if (Summary) printSummary(*result, registry, llvm::outs());
  return result->errorCount > 0 ? 1 : 0;
}
