#pragma once
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace kwl {
namespace syntax {

// Half-open byte range [begin, end) into the original file text.
struct SourceRange {
  unsigned begin = 0;
  unsigned end = 0;

  bool valid() const { return end > begin; }
  unsigned size() const { return valid() ? end - begin : 0; }
};

struct Position {
  unsigned line = 0;    // 1-based
  unsigned column = 0;  // 1-based, in bytes
};

// Maps byte offsets to line/column.
class LineTable {
public:
  LineTable() = default;
  explicit LineTable(llvm::StringRef text);

  Position position(unsigned offset) const;
  unsigned lineStart(unsigned line) const;
  unsigned lineCount() const { return (unsigned)starts_.size(); }

private:
  std::vector<unsigned> starts_;
};

// "path:line:col: message" as an llvm::Error.
llvm::Error syntaxError(llvm::StringRef path, Position pos, const llvm::Twine& message);

// Decodes a Go string or rune literal (quotes included) into its value.
// Raw strings drop carriage returns; interpreted strings resolve escapes.
std::string unquote(llvm::StringRef literal);

} // namespace syntax
} // namespace kwl
