#pragma once
#include "syntax/Ast.hpp"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <string>

namespace kwl {
namespace syntax {

// Parses declaration-level Go source. The returned tree owns `text`.
llvm::Expected<std::unique_ptr<SourceFile>> parseSource(std::string path, std::string text);

// Reads and parses a file from disk.
llvm::Expected<std::unique_ptr<SourceFile>> parseFile(llvm::StringRef path);

} // namespace syntax
} // namespace kwl
