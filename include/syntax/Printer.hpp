#pragma once
#include "syntax/Ast.hpp"
#include <memory>
#include <string>

namespace kwl {
namespace syntax {

// Serialises a (possibly mutated) file back to source. Untouched regions
// are copied from the original text, so a file without edits prints
// byte-identical to its input.
class Printer {
public:
  explicit Printer(const SourceFile& file) : file_(file) {}

  std::string print();

  // Standalone spelling of an expression, as a hoisted declaration would
  // show it.
  std::string printExpr(const Expr* e);

private:
  void emit(const Expr* e, std::string& out);
  void emitSpliced(const Expr* e, std::string& out);
  void emitComposite(const CompositeLit* lit, std::string& out);
  void render(const Expr* e, std::string& out);
  void renderDecl(const ValueDecl& decl, std::string& out);
  void emitDecl(const Decl& decl, std::string& out);

  bool dirty(const Expr* e) const;
  llvm::StringRef text(unsigned begin, unsigned end) const;
  std::string lineIndent(unsigned offset) const;
  bool startsLine(unsigned offset) const;
  unsigned anchorOffset(const Expr* e) const;

  const SourceFile& file_;
};

// Prints a file.
std::string print(const SourceFile& file);

// Consumes a mutated tree and returns its source text.
std::string serialize(std::unique_ptr<SourceFile> file);

} // namespace syntax
} // namespace kwl
