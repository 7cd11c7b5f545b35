#include "TestUtil.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "syntax/Parser.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace fs = std::filesystem;

namespace kwl {
namespace test {

std::unique_ptr<syntax::SourceFile> parse(llvm::StringRef text, llvm::StringRef path) {
  auto file = syntax::parseSource(path.str(), text.str());
  if (!file) {
    ADD_FAILURE() << llvm::toString(file.takeError());
    return nullptr;
  }
  return std::move(*file);
}

std::vector<Issue> runRule(llvm::StringRef ruleId, llvm::StringRef text) {
  const Rule* rule = defaultRuleRegistry().find(ruleId);
  if (!rule) {
    ADD_FAILURE() << "unknown rule " << ruleId.str();
    return {};
  }
  auto file = parse(text);
  if (!file) return {};
  return rule->check(*file);
}

std::string manifest(llvm::StringRef decls) {
  return "package main\n\n" + decls.str();
}

TempDir::TempDir() {
  llvm::SmallString<128> dir;
  std::error_code ec = llvm::sys::fs::createUniqueDirectory("kwlint-test", dir);
  if (ec) ADD_FAILURE() << "cannot create temp dir: " << ec.message();
  path_ = dir.str().str();
}

TempDir::~TempDir() {
  std::error_code ec;
  if (!path_.empty()) fs::remove_all(path_, ec);
}

std::string TempDir::write(llvm::StringRef relative, llvm::StringRef contents) const {
  fs::path full = fs::path(path_) / relative.str();
  fs::create_directories(full.parent_path());
  std::ofstream ofs(full, std::ios::binary | std::ios::trunc);
  ofs << contents.str();
  return full.string();
}

std::string TempDir::read(llvm::StringRef relative) const {
  std::ifstream ifs(fs::path(path_) / relative.str(), std::ios::binary);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

bool TempDir::exists(llvm::StringRef relative) const {
  return fs::exists(fs::path(path_) / relative.str());
}

} // namespace test
} // namespace kwl
