#pragma once
#include "analyzers/Issue.hpp"
#include "analyzers/Rule.hpp"
#include "syntax/Ast.hpp"
#include "llvm/Support/Error.h"
#include <memory>
#include <string>
#include <vector>

namespace kwl {

class RuleRegistry;

struct RefactorOptions {
  Config config;
  unsigned jobs = 0;          // 0 = hardware concurrency
  bool backup = true;         // keep .bak copies before writing
};

struct FixOutcome {
  std::vector<FixResult> results;
  std::unique_ptr<syntax::SourceFile> file;
};

// Applies the automated fixes of enabled rules. Files are rewritten
// through a temporary sibling that is renamed over the original, and only
// when a fix changed their text.
class RefactorEngine {
public:
  RefactorEngine(const RuleRegistry& registry, RefactorOptions options);

  FixOutcome fix(std::unique_ptr<syntax::SourceFile> file) const;

  llvm::Expected<std::vector<FixResult>> fixFile(llvm::StringRef path) const;

  // Fixes a file, or every source file below a directory that has issues
  // from a fixable rule.
  llvm::Expected<std::vector<FixResult>> fixPath(llvm::StringRef path) const;

private:
  std::vector<FixResult> fixParsed(std::unique_ptr<syntax::SourceFile> file) const;
  bool needsFix(const syntax::SourceFile& file) const;

  std::vector<const Rule*> fixers_;
  RefactorOptions options_;
};

} // namespace kwl
