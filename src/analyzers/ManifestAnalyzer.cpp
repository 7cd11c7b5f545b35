#include "analyzers/Analyzer.hpp"
#include "analyzers/FileDiscovery.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "syntax/Parser.hpp"

#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"
#include "llvm/Support/WithColor.h"
#include <filesystem>

namespace kwl {

namespace {

// Outcome of one file in a directory run, filled by a worker.
struct FileSlot {
  std::vector<Issue> issues;
  std::string warning;
};

class ManifestAnalyzer : public Analyzer {
public:
  ManifestAnalyzer(const RuleRegistry& registry, AnalyzeOptions options)
    : rules_(registry.enabledRules(options.config)), options_(std::move(options)) {}

  std::vector<Issue> check(const syntax::SourceFile& file) const override {
    std::vector<Issue> out;
    for (const Rule* rule : rules_) {
      std::vector<Issue> found = rule->check(file);
      for (auto& issue : found)
        if (options_.config.admits(issue.severity)) out.push_back(std::move(issue));
    }
    return out;
  }

  llvm::Expected<std::vector<Issue>> analyzeFile(llvm::StringRef path) const override {
    auto file = syntax::parseFile(path);
    if (!file) return file.takeError();
    return check(**file);
  }

  llvm::Expected<LintResult> analyzePath(llvm::StringRef path) const override {
    auto files = discoverSources(path);
    if (!files) return files.takeError();

    LintResult result;
    std::error_code ec;
    if (!std::filesystem::is_directory(path.str(), ec)) {
      auto issues = analyzeFile(path);
      if (!issues) return issues.takeError();
      result.totalFiles = 1;
      result.add(std::move(*issues));
      return result;
    }

    std::vector<FileSlot> slots(files->size());
    {
      llvm::ThreadPool pool(llvm::hardware_concurrency(options_.jobs));
      for (size_t i = 0; i < files->size(); ++i) {
        pool.async([this, &slots, &files, i] {
          auto issues = analyzeFile((*files)[i]);
          if (!issues) {
            slots[i].warning = "skipping " + (*files)[i] + ": " + llvm::toString(issues.takeError());
            return;
          }
          slots[i].issues = std::move(*issues);
        });
      }
      pool.wait();
    }

    result.totalFiles = (unsigned)files->size();
    for (auto& slot : slots) {
      if (!slot.warning.empty()) llvm::WithColor::warning() << slot.warning << "\n";
      result.add(std::move(slot.issues));
    }
    return result;
  }

private:
  std::vector<const Rule*> rules_;
  AnalyzeOptions options_;
};

} // namespace

std::unique_ptr<Analyzer> makeManifestAnalyzer(const RuleRegistry& registry,
                                               AnalyzeOptions options) {
  return std::make_unique<ManifestAnalyzer>(registry, std::move(options));
}

} // namespace kwl
