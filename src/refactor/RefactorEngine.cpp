#include "refactor/RefactorEngine.hpp"
#include "analyzers/FileDiscovery.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "syntax/Parser.hpp"
#include "syntax/Printer.hpp"

#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"
#include "llvm/Support/WithColor.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
namespace kwl {

// Returns an empty string on success. A file opened here but left
// half-written is removed; a path that could not be opened is left alone.
static std::string writeFile(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return "Failed to open " + path + " for writing";
  ofs << data;
  ofs.close();
  if (ofs) return std::string();
  std::error_code ignored;
  fs::remove(path, ignored);
  return "Failed to write " + path;
}

// Writes through a temporary sibling so a failed write never leaves the
// original half-written. The backup is taken only once the new text is on
// disk. Returns an empty string on success.
static std::string replaceFile(const std::string& path, const std::string& data, bool backup) {
  std::string tmp = path + ".kwlint.tmp";
  std::string error = writeFile(tmp, data);
  if (!error.empty()) return error;

  std::error_code ec;
  if (backup) {
    fs::copy_file(path, path + ".bak", fs::copy_options::overwrite_existing, ec);
    if (ec) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return "Failed to back up " + path + ": " + ec.message();
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    std::string message = "Failed to replace " + path + ": " + ec.message();
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return message;
  }
  return std::string();
}

RefactorEngine::RefactorEngine(const RuleRegistry& registry, RefactorOptions options)
  : options_(std::move(options)) {
  for (const Rule* rule : registry.enabledRules(options_.config))
    if (rule->fixable()) fixers_.push_back(rule);
}

FixOutcome RefactorEngine::fix(std::unique_ptr<syntax::SourceFile> file) const {
  FixOutcome outcome;
  for (const Rule* rule : fixers_) {
    std::vector<FixResult> results = rule->fix(*file);
    for (auto& r : results) outcome.results.push_back(std::move(r));
  }
  outcome.file = std::move(file);
  return outcome;
}

bool RefactorEngine::needsFix(const syntax::SourceFile& file) const {
  for (const Rule* rule : fixers_)
    if (!rule->check(file).empty()) return true;
  return false;
}

std::vector<FixResult> RefactorEngine::fixParsed(std::unique_ptr<syntax::SourceFile> file) const {
  FixOutcome outcome = fix(std::move(file));
  const syntax::SourceFile& fixed = *outcome.file;
  std::string text = syntax::print(fixed);
  if (text == fixed.text) return std::move(outcome.results);

  std::string error = replaceFile(fixed.path, text, options_.backup);
  if (!error.empty()) {
    for (auto& r : outcome.results) {
      r.fixed = false;
      r.error = error;
    }
  }
  return std::move(outcome.results);
}

llvm::Expected<std::vector<FixResult>> RefactorEngine::fixFile(llvm::StringRef path) const {
  auto file = syntax::parseFile(path);
  if (!file) return file.takeError();
  return fixParsed(std::move(*file));
}

llvm::Expected<std::vector<FixResult>> RefactorEngine::fixPath(llvm::StringRef path) const {
  auto files = discoverSources(path);
  if (!files) return files.takeError();

  std::error_code ec;
  if (!fs::is_directory(path.str(), ec)) return fixFile(path);

  struct Slot {
    std::vector<FixResult> results;
    std::string warning;
  };
  std::vector<Slot> slots(files->size());
  {
    llvm::ThreadPool pool(llvm::hardware_concurrency(options_.jobs));
    for (size_t i = 0; i < files->size(); ++i) {
      pool.async([this, &slots, &files, i] {
        const std::string& path = (*files)[i];
        auto file = syntax::parseFile(path);
        if (!file) {
          slots[i].warning = "skipping " + path + ": " + llvm::toString(file.takeError());
          return;
        }
        if (!needsFix(**file)) return;
        slots[i].results = fixParsed(std::move(*file));
      });
    }
    pool.wait();
  }

  std::vector<FixResult> results;
  for (auto& slot : slots) {
    if (!slot.warning.empty()) llvm::WithColor::warning() << slot.warning << "\n";
    for (auto& r : slot.results) results.push_back(std::move(r));
  }
  return results;
}

} // namespace kwl
