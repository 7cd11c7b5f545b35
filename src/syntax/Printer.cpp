#include "syntax/Printer.hpp"

namespace kwl {
namespace syntax {

// Strips `base` from the start of every continuation line.
static std::string reindent(llvm::StringRef s, llvm::StringRef base) {
  if (base.empty()) return s.str();
  std::string out;
  out.reserve(s.size());
  while (!s.empty()) {
    size_t nl = s.find('\n');
    if (nl == llvm::StringRef::npos) {
      out += s.str();
      break;
    }
    out += s.take_front(nl + 1).str();
    s = s.drop_front(nl + 1);
    if (s.startswith(base)) s = s.drop_front(base.size());
  }
  return out;
}

llvm::StringRef Printer::text(unsigned begin, unsigned end) const {
  if (end <= begin) return llvm::StringRef();
  return llvm::StringRef(file_.text).slice(begin, end);
}

std::string Printer::lineIndent(unsigned offset) const {
  unsigned start = file_.lines.lineStart(file_.position(offset).line);
  llvm::StringRef line = llvm::StringRef(file_.text).drop_front(start);
  return line.take_while([](char c) { return c == ' ' || c == '\t'; }).str();
}

bool Printer::startsLine(unsigned offset) const {
  unsigned start = file_.lines.lineStart(file_.position(offset).line);
  return text(start, offset).trim(" \t").empty();
}

unsigned Printer::anchorOffset(const Expr* e) const {
  if (e->range.valid()) return e->range.begin;
  for (const Expr* c : children(e)) {
    unsigned off = anchorOffset(c);
    if (off != ~0u) return off;
  }
  return ~0u;
}

bool Printer::dirty(const Expr* e) const {
  if (e->edited() || !e->range.valid()) return true;
  for (const Expr* c : children(e))
    if (dirty(c)) return true;
  return false;
}

void Printer::emit(const Expr* e, std::string& out) {
  if (!e->range.valid()) {
    render(e, out);
    return;
  }
  if (!dirty(e)) {
    out += text(e->range.begin, e->range.end).str();
    return;
  }
  if (const auto* lit = llvm::dyn_cast<CompositeLit>(e)) {
    if (lit->edited()) {
      emitComposite(lit, out);
      return;
    }
  }
  emitSpliced(e, out);
}

// Copies the node's text, substituting each changed child in place.
void Printer::emitSpliced(const Expr* e, std::string& out) {
  unsigned cursor = e->range.begin;
  for (const Expr* c : children(e)) {
    SourceRange ext = c->extent();
    if (!ext.valid()) {
      render(c, out);
      continue;
    }
    out += text(cursor, ext.begin).str();
    emit(c, out);
    cursor = ext.end;
  }
  out += text(cursor, e->range.end).str();
}

// Rebuilds an edited literal element by element. Original gaps (commas,
// comments, line breaks) are kept; inserted elements go on their own line
// when the literal is laid out one element per line.
void Printer::emitComposite(const CompositeLit* lit, std::string& out) {
  unsigned cursor = lit->range.begin;
  if (lit->type) {
    SourceRange ext = lit->type->extent();
    if (ext.valid()) {
      out += text(cursor, ext.begin).str();
      emit(lit->type.get(), out);
      cursor = ext.end;
    } else {
      render(lit->type.get(), out);
    }
  }
  out += text(cursor, lit->lbrace + 1).str();
  cursor = lit->lbrace + 1;

  const Expr* anchor = nullptr;
  bool emittedAny = false;
  bool lineOpen = false;
  std::string indent;

  for (size_t i = 0; i < lit->elements.size(); ++i) {
    const Expr* el = lit->elements[i].get();
    SourceRange ext = el->extent();
    if (ext.valid()) {
      out += text(cursor, ext.begin).str();
      emit(el, out);
      cursor = ext.end;
      anchor = el;
      emittedAny = true;
      lineOpen = false;
      continue;
    }

    if (lineOpen) {
      out += "\n" + indent + printExpr(el) + ",";
      continue;
    }

    unsigned boundary = lit->rbrace;
    for (size_t j = i + 1; j < lit->elements.size(); ++j) {
      SourceRange next = lit->elements[j]->extent();
      if (next.valid()) {
        boundary = next.begin;
        break;
      }
    }
    llvm::StringRef gap = text(cursor, boundary);
    size_t nl = gap.find('\n');
    if (nl != llvm::StringRef::npos) {
      llvm::StringRef before = gap.take_front(nl);
      if (emittedAny && !before.split("//").first.contains(',')) out += ",";
      out += before.str();
      if (boundary != lit->rbrace)
        indent = lineIndent(boundary);
      else if (anchor && startsLine(anchor->extent().begin))
        indent = lineIndent(anchor->extent().begin);
      else
        indent = lineIndent(lit->lbrace) + "\t";
      out += "\n" + indent + printExpr(el) + ",";
      cursor += (unsigned)nl;
      lineOpen = true;
    } else {
      if (emittedAny) out += ", ";
      out += printExpr(el);
    }
    emittedAny = true;
  }

  out += text(cursor, lit->rbrace + 1).str();
  out += text(lit->rbrace + 1, lit->range.end).str();
}

// Spells a synthesized node from its fields.
void Printer::render(const Expr* e, std::string& out) {
  auto list = [&](const std::vector<ExprPtr>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
      if (i) out += ", ";
      emit(items[i].get(), out);
    }
  };

  switch (e->kind()) {
  case Expr::Kind::Ident:
    out += llvm::cast<Ident>(e)->name;
    return;
  case Expr::Kind::BasicLit:
    out += llvm::cast<BasicLit>(e)->text;
    return;
  case Expr::Kind::CompositeLit: {
    const auto* lit = llvm::cast<CompositeLit>(e);
    if (lit->type) emit(lit->type.get(), out);
    out += "{";
    list(lit->elements);
    out += "}";
    return;
  }
  case Expr::Kind::KeyValue: {
    const auto* kv = llvm::cast<KeyValueExpr>(e);
    emit(kv->key.get(), out);
    out += ": ";
    emit(kv->value.get(), out);
    return;
  }
  case Expr::Kind::Unary: {
    const auto* un = llvm::cast<UnaryExpr>(e);
    out += un->op;
    emit(un->operand.get(), out);
    return;
  }
  case Expr::Kind::Binary: {
    const auto* bin = llvm::cast<BinaryExpr>(e);
    emit(bin->lhs.get(), out);
    out += " " + bin->op + " ";
    emit(bin->rhs.get(), out);
    return;
  }
  case Expr::Kind::Selector: {
    const auto* sel = llvm::cast<SelectorExpr>(e);
    emit(sel->base.get(), out);
    out += "." + sel->field;
    return;
  }
  case Expr::Kind::Call: {
    const auto* call = llvm::cast<CallExpr>(e);
    emit(call->callee.get(), out);
    out += "(";
    list(call->args);
    if (call->hasEllipsis) out += "...";
    out += ")";
    return;
  }
  case Expr::Kind::Index: {
    const auto* idx = llvm::cast<IndexExpr>(e);
    emit(idx->base.get(), out);
    out += "[";
    list(idx->indices);
    out += "]";
    return;
  }
  case Expr::Kind::Paren:
    out += "(";
    emit(llvm::cast<ParenExpr>(e)->inner.get(), out);
    out += ")";
    return;
  case Expr::Kind::ArrayType: {
    const auto* arr = llvm::cast<ArrayTypeExpr>(e);
    out += "[";
    if (arr->length) emit(arr->length.get(), out);
    out += "]";
    emit(arr->element.get(), out);
    return;
  }
  case Expr::Kind::MapType: {
    const auto* map = llvm::cast<MapTypeExpr>(e);
    out += "map[";
    emit(map->key.get(), out);
    out += "]";
    emit(map->value.get(), out);
    return;
  }
  case Expr::Kind::Opaque:
    // Only ever parsed, so it always has a range.
    out += text(e->range.begin, e->range.end).str();
    return;
  }
}

std::string Printer::printExpr(const Expr* e) {
  std::string out;
  emit(e, out);
  unsigned anchor = anchorOffset(e);
  if (anchor == ~0u) return out;
  return reindent(out, lineIndent(anchor));
}

void Printer::renderDecl(const ValueDecl& decl, std::string& out) {
  auto spec = [&](const ValueSpec& s) {
    for (size_t i = 0; i < s.names.size(); ++i) {
      if (i) out += ", ";
      out += s.names[i].name;
    }
    if (s.type) out += " " + printExpr(s.type.get());
    for (size_t i = 0; i < s.values.size(); ++i) {
      out += i ? ", " : " = ";
      out += printExpr(s.values[i].get());
    }
  };

  out += decl.isConst ? "const " : "var ";
  if (!decl.grouped && decl.specs.size() == 1) {
    spec(decl.specs.front());
    return;
  }
  out += "(\n";
  for (const auto& s : decl.specs) {
    out += "\t";
    spec(s);
    out += "\n";
  }
  out += ")";
}

void Printer::emitDecl(const Decl& decl, std::string& out) {
  out += text(decl.docBegin, decl.range.begin).str();
  unsigned cursor = decl.range.begin;
  auto splice = [&](const ExprPtr& e) {
    SourceRange ext = e->extent();
    if (!ext.valid()) return;
    out += text(cursor, ext.begin).str();
    emit(e.get(), out);
    cursor = ext.end;
  };
  if (const auto* vd = llvm::dyn_cast<ValueDecl>(&decl)) {
    for (const auto& s : vd->specs)
      for (const auto& v : s.values) splice(v);
  } else {
    for (const auto& c : llvm::cast<OpaqueDecl>(&decl)->contents) splice(c);
  }
  out += text(cursor, decl.range.end).str();
}

std::string Printer::print() {
  std::string out;
  out.reserve(file_.text.size());
  unsigned cursor = 0;
  std::vector<const ValueDecl*> pending;

  for (const auto& decl : file_.decls) {
    if (decl->synthesized()) {
      if (const auto* vd = llvm::dyn_cast<ValueDecl>(decl.get())) pending.push_back(vd);
      continue;
    }
    out += text(cursor, decl->docBegin).str();
    for (const ValueDecl* p : pending) {
      renderDecl(*p, out);
      out += "\n\n";
    }
    pending.clear();
    emitDecl(*decl, out);
    cursor = decl->range.end;
  }
  out += text(cursor, (unsigned)file_.text.size()).str();

  if (!pending.empty()) {
    if (!out.empty() && out.back() != '\n') out += "\n";
    for (const ValueDecl* p : pending) {
      out += "\n";
      renderDecl(*p, out);
      out += "\n";
    }
  }
  return out;
}

std::string print(const SourceFile& file) {
  return Printer(file).print();
}

std::string serialize(std::unique_ptr<SourceFile> file) {
  if (!file) return std::string();
  return print(*file);
}

} // namespace syntax
} // namespace kwl
