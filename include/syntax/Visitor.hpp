#pragma once
#include "syntax/Ast.hpp"
#include <functional>

namespace kwl {
namespace syntax {

// Pre-order traversal over every expression of a file, in the manner of
// clang's RecursiveASTVisitor. Derived classes override the visit hooks;
// returning false from a hook skips that node's children.
template <typename Derived>
class RecursiveVisitor {
public:
  bool visitExpr(const Expr*) { return true; }
  bool visitCompositeLit(const CompositeLit*) { return true; }
  bool visitBasicLit(const BasicLit*) { return true; }

  void traverseFile(const SourceFile& file) {
    for (const auto& decl : file.decls) traverseDecl(decl.get());
  }

  void traverseDecl(const Decl* decl) {
    if (const auto* vd = llvm::dyn_cast<ValueDecl>(decl)) {
      for (const auto& spec : vd->specs) {
        traverseExpr(spec.type.get());
        for (const auto& v : spec.values) traverseExpr(v.get());
      }
      return;
    }
    for (const auto& c : llvm::cast<OpaqueDecl>(decl)->contents) traverseExpr(c.get());
  }

  void traverseExpr(const Expr* e) {
    if (!e || !derived().visitExpr(e)) return;
    switch (e->kind()) {
    case Expr::Kind::Ident:
      return;
    case Expr::Kind::BasicLit:
      derived().visitBasicLit(llvm::cast<BasicLit>(e));
      return;
    case Expr::Kind::CompositeLit: {
      const auto* lit = llvm::cast<CompositeLit>(e);
      if (!derived().visitCompositeLit(lit)) return;
      traverseExpr(lit->type.get());
      for (const auto& el : lit->elements) traverseExpr(el.get());
      return;
    }
    case Expr::Kind::KeyValue: {
      const auto* kv = llvm::cast<KeyValueExpr>(e);
      traverseExpr(kv->key.get());
      traverseExpr(kv->value.get());
      return;
    }
    case Expr::Kind::Unary:
      traverseExpr(llvm::cast<UnaryExpr>(e)->operand.get());
      return;
    case Expr::Kind::Binary: {
      const auto* bin = llvm::cast<BinaryExpr>(e);
      traverseExpr(bin->lhs.get());
      traverseExpr(bin->rhs.get());
      return;
    }
    case Expr::Kind::Selector:
      traverseExpr(llvm::cast<SelectorExpr>(e)->base.get());
      return;
    case Expr::Kind::Call: {
      const auto* call = llvm::cast<CallExpr>(e);
      traverseExpr(call->callee.get());
      for (const auto& a : call->args) traverseExpr(a.get());
      return;
    }
    case Expr::Kind::Index: {
      const auto* idx = llvm::cast<IndexExpr>(e);
      traverseExpr(idx->base.get());
      for (const auto& i : idx->indices) traverseExpr(i.get());
      return;
    }
    case Expr::Kind::Paren:
      traverseExpr(llvm::cast<ParenExpr>(e)->inner.get());
      return;
    case Expr::Kind::ArrayType: {
      const auto* arr = llvm::cast<ArrayTypeExpr>(e);
      traverseExpr(arr->length.get());
      traverseExpr(arr->element.get());
      return;
    }
    case Expr::Kind::MapType: {
      const auto* map = llvm::cast<MapTypeExpr>(e);
      traverseExpr(map->key.get());
      traverseExpr(map->value.get());
      return;
    }
    case Expr::Kind::Opaque:
      for (const auto& c : llvm::cast<OpaqueExpr>(e)->contents) traverseExpr(c.get());
      return;
    }
  }

protected:
  Derived& derived() { return *static_cast<Derived*>(this); }
};

// Calls fn on every expression in the file, pre-order.
inline void forEachExpr(const SourceFile& file, const std::function<void(const Expr&)>& fn) {
  struct Walker : RecursiveVisitor<Walker> {
    explicit Walker(const std::function<void(const Expr&)>& f) : fn(f) {}
    bool visitExpr(const Expr* e) {
      fn(*e);
      return true;
    }
    const std::function<void(const Expr&)>& fn;
  };
  Walker walker(fn);
  walker.traverseFile(file);
}

// Mutable pre-order walk for fix passes. fn must not remove or replace the
// node it is given, but may edit it in place.
inline void forEachMutableExpr(SourceFile& file, const std::function<void(Expr&)>& fn) {
  std::function<void(Expr*)> walk = [&](Expr* e) {
    if (!e) return;
    fn(*e);
    for (Expr* c : children(e)) walk(c);
  };
  for (auto& decl : file.decls) {
    if (auto* vd = llvm::dyn_cast<ValueDecl>(decl.get())) {
      for (auto& spec : vd->specs) {
        walk(spec.type.get());
        for (auto& v : spec.values) walk(v.get());
      }
      continue;
    }
    for (auto& c : llvm::cast<OpaqueDecl>(decl.get())->contents) walk(c.get());
  }
}

} // namespace syntax
} // namespace kwl
