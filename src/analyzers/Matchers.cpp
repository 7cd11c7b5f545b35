#include "analyzers/Matchers.hpp"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

using namespace kwl::syntax;

namespace kwl {
namespace match {

static const Expr* stripParens(const Expr* e) {
  while (const auto* p = llvm::dyn_cast_or_null<ParenExpr>(e)) e = p->inner.get();
  return e;
}

// The single argument of a helper or conversion call, or null.
static const Expr* wrappedArgument(const Expr* e) {
  const auto* call = llvm::dyn_cast_or_null<CallExpr>(e);
  if (!call || call->args.size() != 1 || call->hasEllipsis) return nullptr;
  return call->args.front().get();
}

const CompositeLit* compositeOf(const Expr* e) {
  e = stripParens(e);
  if (const auto* un = llvm::dyn_cast_or_null<UnaryExpr>(e)) {
    if (un->op != "&") return nullptr;
    e = stripParens(un->operand.get());
  }
  return llvm::dyn_cast_or_null<CompositeLit>(e);
}

static llvm::StringRef lastComponent(const Expr* type) {
  type = stripParens(type);
  if (!type) return llvm::StringRef();
  if (const auto* id = llvm::dyn_cast<Ident>(type)) return id->name;
  if (const auto* sel = llvm::dyn_cast<SelectorExpr>(type)) {
    if (llvm::isa<Ident>(sel->base.get())) return sel->field;
    return llvm::StringRef();
  }
  if (const auto* inst = llvm::dyn_cast<IndexExpr>(type)) return lastComponent(inst->base.get());
  return llvm::StringRef();
}

llvm::StringRef typeNameOf(const Expr* e) {
  const CompositeLit* lit = compositeOf(e);
  if (!lit) return llvm::StringRef();
  if (lit->type) return lastComponent(lit->type.get());

  llvm::StringRef spelled(lit->impliedType);
  if (spelled.empty() || spelled.find_first_of("[]*{}() ") != llvm::StringRef::npos)
    return llvm::StringRef();
  size_t dot = spelled.rfind('.');
  return dot == llvm::StringRef::npos ? spelled : spelled.drop_front(dot + 1);
}

bool isShape(const Expr* e, llvm::StringRef typeName) {
  return !typeName.empty() && typeNameOf(e) == typeName;
}

const KeyValueExpr* field(const CompositeLit* lit, llvm::StringRef name) {
  if (!lit) return nullptr;
  for (const auto& el : lit->elements) {
    const auto* kv = llvm::dyn_cast<KeyValueExpr>(el.get());
    if (kv && kv->keyName() == name) return kv;
  }
  return nullptr;
}

const Expr* fieldValue(const CompositeLit* lit, llvm::StringRef name) {
  const KeyValueExpr* kv = field(lit, name);
  return kv ? kv->value.get() : nullptr;
}

const CompositeLit* nestedRecord(const Expr* e) { return compositeOf(e); }

const CompositeLit* fieldRecord(const CompositeLit* lit, llvm::StringRef name) {
  return nestedRecord(fieldValue(lit, name));
}

const CompositeLit* fieldPath(const CompositeLit* lit, std::initializer_list<llvm::StringRef> path) {
  for (llvm::StringRef hop : path) {
    lit = fieldRecord(lit, hop);
    if (!lit) return nullptr;
  }
  return lit;
}

const CompositeLit* metadataOf(const CompositeLit* lit) {
  if (const CompositeLit* meta = fieldRecord(lit, "ObjectMeta")) return meta;
  return fieldRecord(lit, "Metadata");
}

std::optional<std::string> stringLiteral(const Expr* e) {
  e = stripParens(e);
  if (const Expr* arg = wrappedArgument(e)) e = stripParens(arg);
  const auto* lit = llvm::dyn_cast_or_null<BasicLit>(e);
  if (!lit || lit->litKind != LitKind::String) return std::nullopt;
  return lit->value();
}

std::optional<int64_t> intLiteral(const Expr* e) {
  e = stripParens(e);
  if (!e) return std::nullopt;
  if (const auto* lit = llvm::dyn_cast<BasicLit>(e)) {
    if (lit->litKind != LitKind::Int) return std::nullopt;
    std::string digits;
    for (char c : lit->text)
      if (c != '_') digits.push_back(c);
    int64_t value = 0;
    if (llvm::StringRef(digits).getAsInteger(0, value)) return std::nullopt;
    return value;
  }
  if (const Expr* arg = wrappedArgument(e)) return intLiteral(arg);
  if (const auto* un = llvm::dyn_cast<UnaryExpr>(e)) {
    std::optional<int64_t> v = intLiteral(un->operand.get());
    if (!v) return std::nullopt;
    if (un->op == "-") return -*v;
    if (un->op == "&" || un->op == "+") return v;
  }
  return std::nullopt;
}

std::optional<bool> boolLiteral(const Expr* e) {
  e = stripParens(e);
  if (!e) return std::nullopt;
  if (const auto* id = llvm::dyn_cast<Ident>(e)) {
    if (id->name == "true") return true;
    if (id->name == "false") return false;
    return std::nullopt;
  }
  if (const Expr* arg = wrappedArgument(e)) return boolLiteral(arg);
  if (const auto* un = llvm::dyn_cast<UnaryExpr>(e)) {
    std::optional<bool> v = boolLiteral(un->operand.get());
    if (v && un->op == "!") return !*v;
    if (un->op == "&") return v;
  }
  return std::nullopt;
}

bool isTrue(const Expr* e) {
  std::optional<bool> v = boolLiteral(e);
  return v && *v;
}

std::map<std::string, std::string> mapLiteral(const Expr* e) {
  std::map<std::string, std::string> out;
  const CompositeLit* lit = compositeOf(e);
  if (!lit) return out;
  for (const auto& el : lit->elements) {
    const auto* kv = llvm::dyn_cast<KeyValueExpr>(el.get());
    if (!kv) continue;
    const auto* key = llvm::dyn_cast<BasicLit>(stripParens(kv->key.get()));
    const auto* value = llvm::dyn_cast<BasicLit>(stripParens(kv->value.get()));
    if (!key || !value || key->litKind != LitKind::String || value->litKind != LitKind::String)
      continue;
    out[key->value()] = value->value();
  }
  return out;
}

std::string quote(llvm::StringRef s) {
  std::string out;
  llvm::raw_string_ostream os(out);
  os << '"';
  for (unsigned char c : s) {
    switch (c) {
    case '"': os << "\\\""; break;
    case '\\': os << "\\\\"; break;
    case '\n': os << "\\n"; break;
    case '\t': os << "\\t"; break;
    case '\r': os << "\\r"; break;
    default:
      if (c < 0x20 || c == 0x7f) os << "\\x" << llvm::format_hex_no_prefix(c, 2);
      else os << c;
    }
  }
  os << '"';
  return os.str();
}

} // namespace match
} // namespace kwl
