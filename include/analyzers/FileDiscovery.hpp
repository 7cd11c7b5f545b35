#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace kwl {

// A file path is returned as given. A directory is walked recursively for
// `.go` files, leaving out `_test.go`, in sorted order.
llvm::Expected<std::vector<std::string>> discoverSources(llvm::StringRef path);

} // namespace kwl
