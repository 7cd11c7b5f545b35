#include "syntax/Ast.hpp"
#include <algorithm>
#include <cctype>

namespace kwl {
namespace syntax {

std::string BasicLit::value() const {
  if (litKind == LitKind::String || litKind == LitKind::Char) return unquote(text);
  return text;
}

llvm::StringRef KeyValueExpr::keyName() const {
  if (const auto* id = llvm::dyn_cast_or_null<Ident>(key.get())) return id->name;
  return llvm::StringRef();
}

ExprPtr KeyValueExpr::replaceValue(ExprPtr v) {
  ExprPtr old = std::move(value);
  value = std::move(v);
  if (old && value) value->slot = old->extent();
  markEdited();
  return old;
}

void CompositeLit::insertElementAfter(const Expr* anchor, ExprPtr element) {
  auto it = std::find_if(elements.begin(), elements.end(),
                         [&](const ExprPtr& e) { return e.get() == anchor; });
  if (it == elements.end()) {
    appendElement(std::move(element));
    return;
  }
  elements.insert(it + 1, std::move(element));
  markEdited();
}

void CompositeLit::appendElement(ExprPtr element) {
  elements.push_back(std::move(element));
  markEdited();
}

ExprPtr CompositeLit::replaceElement(size_t index, ExprPtr element) {
  if (index >= elements.size()) return nullptr;
  ExprPtr old = std::move(elements[index]);
  elements[index] = std::move(element);
  if (old && elements[index]) elements[index]->slot = old->extent();
  markEdited();
  return old;
}

namespace {

// Shared by the const and mutable children() overloads; E is Expr or const Expr.
template <typename E>
llvm::SmallVector<E*, 4> childrenOf(E* e) {
  llvm::SmallVector<E*, 4> out;
  auto add = [&](const ExprPtr& c) { if (c) out.push_back(c.get()); };
  switch (e->kind()) {
  case Expr::Kind::Ident:
  case Expr::Kind::BasicLit:
    break;
  case Expr::Kind::CompositeLit: {
    auto* lit = llvm::cast<CompositeLit>(e);
    add(lit->type);
    for (const auto& el : lit->elements) add(el);
    break;
  }
  case Expr::Kind::KeyValue:
    add(llvm::cast<KeyValueExpr>(e)->key);
    add(llvm::cast<KeyValueExpr>(e)->value);
    break;
  case Expr::Kind::Unary:
    add(llvm::cast<UnaryExpr>(e)->operand);
    break;
  case Expr::Kind::Binary:
    add(llvm::cast<BinaryExpr>(e)->lhs);
    add(llvm::cast<BinaryExpr>(e)->rhs);
    break;
  case Expr::Kind::Selector:
    add(llvm::cast<SelectorExpr>(e)->base);
    break;
  case Expr::Kind::Call: {
    auto* call = llvm::cast<CallExpr>(e);
    add(call->callee);
    for (const auto& a : call->args) add(a);
    break;
  }
  case Expr::Kind::Index: {
    auto* idx = llvm::cast<IndexExpr>(e);
    add(idx->base);
    for (const auto& i : idx->indices) add(i);
    break;
  }
  case Expr::Kind::Paren:
    add(llvm::cast<ParenExpr>(e)->inner);
    break;
  case Expr::Kind::ArrayType:
    add(llvm::cast<ArrayTypeExpr>(e)->length);
    add(llvm::cast<ArrayTypeExpr>(e)->element);
    break;
  case Expr::Kind::MapType:
    add(llvm::cast<MapTypeExpr>(e)->key);
    add(llvm::cast<MapTypeExpr>(e)->value);
    break;
  case Expr::Kind::Opaque:
    for (const auto& c : llvm::cast<OpaqueExpr>(e)->contents) add(c);
    break;
  }
  return out;
}

} // namespace

llvm::SmallVector<Expr*, 4> children(Expr* e) { return childrenOf(e); }
llvm::SmallVector<const Expr*, 4> children(const Expr* e) { return childrenOf(e); }

static bool isQualifiedIdent(llvm::StringRef s) {
  if (s.empty()) return false;
  unsigned dots = 0;
  for (char c : s) {
    if (c == '.') { ++dots; continue; }
    if (!(std::isalnum((unsigned char)c) || c == '_' || (unsigned char)c >= 0x80)) return false;
  }
  return dots <= 1 && s.front() != '.' && s.back() != '.';
}

void CompositeLit::materializeType() {
  if (type || impliedType.empty()) return;
  llvm::StringRef spelled(impliedType);
  if (isQualifiedIdent(spelled) && spelled.contains('.')) {
    auto parts = spelled.split('.');
    type = std::make_unique<SelectorExpr>(std::make_unique<Ident>(parts.first.str()),
                                          parts.second.str());
  } else {
    // Slice, map and other composite types print from their spelling.
    type = std::make_unique<Ident>(impliedType);
  }
  markEdited();
}

void SourceFile::insertDeclBefore(size_t index, DeclPtr decl) {
  if (index > decls.size()) index = decls.size();
  decls.insert(decls.begin() + (std::ptrdiff_t)index, std::move(decl));
  edited_ = true;
}

std::unique_ptr<ValueDecl> makeVarDecl(std::string name, ExprPtr value) {
  auto decl = std::make_unique<ValueDecl>();
  ValueSpec spec;
  spec.names.push_back(DeclName{std::move(name), 0});
  spec.values.push_back(std::move(value));
  decl->specs.push_back(std::move(spec));
  return decl;
}

} // namespace syntax
} // namespace kwl
