#pragma once
#include "analyzers/Issue.hpp"
#include "analyzers/Rule.hpp"
#include "syntax/Ast.hpp"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>
#include <memory>

namespace kwl {

class RuleRegistry;

struct AnalyzeOptions {
  Config config;
  unsigned jobs = 0;          // 0 = hardware concurrency
};

class Analyzer {
public:
  virtual ~Analyzer() = default;

  // Issues of one parsed file, in rule order.
  virtual std::vector<Issue> check(const syntax::SourceFile& file) const = 0;

  virtual llvm::Expected<std::vector<Issue>> analyzeFile(llvm::StringRef path) const = 0;

  // Analyses a file or every source file below a directory. Unparseable
  // files in a directory are logged and skipped.
  virtual llvm::Expected<LintResult> analyzePath(llvm::StringRef path) const = 0;
};

std::unique_ptr<Analyzer> makeManifestAnalyzer(const RuleRegistry& registry,
                                               AnalyzeOptions options);

} // namespace kwl
