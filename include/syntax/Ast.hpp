#pragma once
#include "syntax/Source.hpp"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Casting.h"
#include <memory>
#include <string>
#include <vector>

namespace kwl {
namespace syntax {

// Expression tree. Nodes parsed from text carry their byte range; nodes
// created by fixes have an empty range and are printed from their fields.
class Expr {
public:
  enum class Kind {
    Ident,
    BasicLit,
    CompositeLit,
    KeyValue,
    Unary,
    Binary,
    Selector,
    Call,
    Index,
    Paren,
    ArrayType,
    MapType,
    Opaque,
  };

  virtual ~Expr() = default;

  Kind kind() const { return kind_; }
  SourceRange range;
  // For a synthesized node that replaced a parsed one: the text it stands in for.
  SourceRange slot;

  bool synthesized() const { return !range.valid(); }
  SourceRange extent() const { return range.valid() ? range : slot; }
  // Set by mutations; the printer rebuilds edited nodes instead of copying.
  bool edited() const { return edited_; }
  void markEdited() { edited_ = true; }

protected:
  explicit Expr(Kind k) : kind_(k) {}

private:
  Kind kind_;
  bool edited_ = false;
};

using ExprPtr = std::unique_ptr<Expr>;

class Ident : public Expr {
public:
  explicit Ident(std::string n) : Expr(Kind::Ident), name(std::move(n)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Ident; }

  std::string name;
};

enum class LitKind { Int, Float, Imag, Char, String };

class BasicLit : public Expr {
public:
  BasicLit(LitKind k, std::string t) : Expr(Kind::BasicLit), litKind(k), text(std::move(t)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::BasicLit; }

  // Decoded value for strings and runes, raw text otherwise.
  std::string value() const;

  LitKind litKind;
  std::string text;  // as written, quotes included
};

class KeyValueExpr : public Expr {
public:
  KeyValueExpr(ExprPtr k, ExprPtr v) : Expr(Kind::KeyValue), key(std::move(k)), value(std::move(v)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::KeyValue; }

  // Field name when the key is a plain identifier, empty otherwise.
  llvm::StringRef keyName() const;

  // Swaps in a new value and returns the old one.
  ExprPtr replaceValue(ExprPtr v);

  ExprPtr key;
  ExprPtr value;
};

class CompositeLit : public Expr {
public:
  explicit CompositeLit(ExprPtr t) : Expr(Kind::CompositeLit), type(std::move(t)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::CompositeLit; }

  bool elided() const { return !type; }

  void insertElementAfter(const Expr* anchor, ExprPtr element);
  void appendElement(ExprPtr element);
  ExprPtr replaceElement(size_t index, ExprPtr element);

  // Gives an elided literal an explicit type (spelled from impliedType) so
  // it can stand on its own outside its parent.
  void materializeType();

  ExprPtr type;                     // null when elided
  std::vector<ExprPtr> elements;
  unsigned lbrace = 0;              // offset of '{'
  unsigned rbrace = 0;              // offset of '}'
  std::string impliedType;          // element type spelled by the parent, for elided literals
  bool impliedPointer = false;      // parent element type was *T
};

class UnaryExpr : public Expr {
public:
  UnaryExpr(std::string o, ExprPtr x) : Expr(Kind::Unary), op(std::move(o)), operand(std::move(x)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Unary; }

  std::string op;
  ExprPtr operand;
};

class BinaryExpr : public Expr {
public:
  BinaryExpr(std::string o, ExprPtr l, ExprPtr r)
    : Expr(Kind::Binary), op(std::move(o)), lhs(std::move(l)), rhs(std::move(r)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Binary; }

  std::string op;
  ExprPtr lhs;
  ExprPtr rhs;
};

class SelectorExpr : public Expr {
public:
  SelectorExpr(ExprPtr b, std::string f) : Expr(Kind::Selector), base(std::move(b)), field(std::move(f)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Selector; }

  ExprPtr base;
  std::string field;
};

class CallExpr : public Expr {
public:
  explicit CallExpr(ExprPtr c) : Expr(Kind::Call), callee(std::move(c)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Call; }

  ExprPtr callee;
  std::vector<ExprPtr> args;
  bool hasEllipsis = false;
};

// a[i], and generic instantiation ptr.To[int32]
class IndexExpr : public Expr {
public:
  explicit IndexExpr(ExprPtr b) : Expr(Kind::Index), base(std::move(b)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Index; }

  ExprPtr base;
  std::vector<ExprPtr> indices;
};

class ParenExpr : public Expr {
public:
  explicit ParenExpr(ExprPtr x) : Expr(Kind::Paren), inner(std::move(x)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Paren; }

  ExprPtr inner;
};

// []T, [N]T, [...]T
class ArrayTypeExpr : public Expr {
public:
  ArrayTypeExpr(ExprPtr len, ExprPtr elem)
    : Expr(Kind::ArrayType), length(std::move(len)), element(std::move(elem)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::ArrayType; }

  ExprPtr length;   // null for slices
  ExprPtr element;
};

class MapTypeExpr : public Expr {
public:
  MapTypeExpr(ExprPtr k, ExprPtr v) : Expr(Kind::MapType), key(std::move(k)), value(std::move(v)) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::MapType; }

  ExprPtr key;
  ExprPtr value;
};

// Function literals and struct/interface/func/chan type literals. Statements
// are not modelled: `contents` keeps the string literals and the composite
// literal expressions found in the text, in source order.
class OpaqueExpr : public Expr {
public:
  OpaqueExpr() : Expr(Kind::Opaque) {}
  static bool classof(const Expr* e) { return e->kind() == Kind::Opaque; }

  std::vector<ExprPtr> contents;
};

// Direct children in source order.
llvm::SmallVector<Expr*, 4> children(Expr* e);
llvm::SmallVector<const Expr*, 4> children(const Expr* e);

// ---------------------------------------------------------------------------

struct DeclName {
  std::string name;
  unsigned offset = 0;
};

struct ValueSpec {
  std::vector<DeclName> names;
  ExprPtr type;                 // explicit type, may be null
  std::vector<ExprPtr> values;
  SourceRange range;

  // Initializer bound to names[i], or null.
  const Expr* valueFor(size_t i) const { return i < values.size() ? values[i].get() : nullptr; }
};

class Decl {
public:
  enum class Kind { Value, Opaque };

  virtual ~Decl() = default;
  Kind kind() const { return kind_; }

  SourceRange range;
  unsigned docBegin = 0;  // start of the comment group attached above, or range.begin

  bool synthesized() const { return !range.valid(); }

protected:
  explicit Decl(Kind k) : kind_(k) {}

private:
  Kind kind_;
};

using DeclPtr = std::unique_ptr<Decl>;

// var/const declarations, grouped or single.
class ValueDecl : public Decl {
public:
  ValueDecl() : Decl(Kind::Value) {}
  static bool classof(const Decl* d) { return d->kind() == Kind::Value; }

  bool isConst = false;
  bool grouped = false;
  std::vector<ValueSpec> specs;
};

// import/type/func declarations. Like OpaqueExpr, only string literals and
// composite literal expressions of function bodies are kept.
class OpaqueDecl : public Decl {
public:
  enum class Keyword { Import, Type, Func };

  explicit OpaqueDecl(Keyword k) : Decl(Kind::Opaque), keyword(k) {}
  static bool classof(const Decl* d) { return d->kind() == Kind::Opaque; }

  Keyword keyword;
  std::vector<ExprPtr> contents;
};

// One parsed file. Owns its text and tree.
class SourceFile {
public:
  std::string path;
  std::string text;
  std::string packageName;
  unsigned packageOffset = 0;
  std::vector<DeclPtr> decls;
  LineTable lines;

  Position position(unsigned offset) const { return lines.position(offset); }
  llvm::StringRef slice(SourceRange r) const {
    return llvm::StringRef(text).slice(r.begin, r.end);
  }

  // Inserts a synthesized declaration before decls[index].
  void insertDeclBefore(size_t index, DeclPtr decl);
  bool edited() const { return edited_; }

private:
  bool edited_ = false;
};

// Builds `var <name> = <value>` for fixes.
std::unique_ptr<ValueDecl> makeVarDecl(std::string name, ExprPtr value);

} // namespace syntax
} // namespace kwl
