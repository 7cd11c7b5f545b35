#pragma once
#include "analyzers/Issue.hpp"
#include "syntax/Ast.hpp"
#include "llvm/ADT/StringRef.h"
#include <memory>
#include <string>
#include <vector>

namespace kwl {
namespace test {

// Parses `text`, recording a test failure when it does not parse.
std::unique_ptr<syntax::SourceFile> parse(llvm::StringRef text, llvm::StringRef path = "test.go");

// Issues one rule from the default registry reports for `text`.
std::vector<Issue> runRule(llvm::StringRef ruleId, llvm::StringRef text);

// Prepends `package main` to a snippet of declarations.
std::string manifest(llvm::StringRef decls);

// A fresh directory removed when the object goes out of scope.
class TempDir {
public:
  TempDir();
  ~TempDir();

  const std::string& path() const { return path_; }
  std::string write(llvm::StringRef relative, llvm::StringRef contents) const;
  std::string read(llvm::StringRef relative) const;
  bool exists(llvm::StringRef relative) const;

private:
  std::string path_;
};

} // namespace test
} // namespace kwl
