#include "syntax/Parser.hpp"
#include "syntax/Lexer.hpp"
#include "llvm/Support/MemoryBuffer.h"

namespace kwl {
namespace syntax {

namespace {

// Recursive-descent parser over the token stream. The first error wins;
// parse functions return null (or stop) once failed_ is set.
class Parser {
public:
  Parser(SourceFile& file, std::vector<Token> tokens, const std::vector<SourceRange>& comments)
    : file_(file), toks_(std::move(tokens)), comments_(comments) {}

  llvm::Error parse();

private:
  const Token& tok() const { return toks_[idx_]; }
  const Token& peek(unsigned n = 1) const {
    size_t i = idx_ + n;
    return i < toks_.size() ? toks_[i] : toks_.back();
  }
  void next() {
    if (tok().is(TokenKind::Eof)) return;
    if (!tok().is(TokenKind::Semicolon)) prevEnd_ = tok().end();
    ++idx_;
  }
  void skipSemicolons() { while (tok().is(TokenKind::Semicolon)) next(); }

  std::nullptr_t fail(unsigned offset, const llvm::Twine& message) {
    if (!failed_) {
      failed_ = true;
      errOffset_ = offset;
      errMessage_ = message.str();
    }
    return nullptr;
  }
  std::nullptr_t failHere(const llvm::Twine& what) {
    llvm::StringRef found = tok().is(TokenKind::Eof) ? "EOF"
                          : tok().is(TokenKind::Semicolon) ? "newline" : tok().text;
    return fail(tok().offset, "expected " + what + ", found '" + found + "'");
  }
  bool expectOp(llvm::StringRef op) {
    if (tok().isOp(op)) { next(); return true; }
    failHere("'" + op + "'");
    return false;
  }
  template <typename T> std::unique_ptr<T> finish(std::unique_ptr<T> node, unsigned begin) {
    node->range = SourceRange{begin, prevEnd_};
    return node;
  }

  // declarations
  void parseValueDecl();
  bool parseValueSpec(ValueSpec& spec);
  void parseOpaqueDecl();
  void attachDocComments();

  // expressions
  ExprPtr parseExpr() { return parseBinary(1); }
  ExprPtr parseBinary(int minPrec);
  ExprPtr parseUnary();
  ExprPtr parsePrimary();
  ExprPtr parseOperand();
  ExprPtr parseType();
  ExprPtr parseArrayType();
  ExprPtr parseMapType();
  ExprPtr parseOpaque();
  ExprPtr parseComposite(ExprPtr type, const Expr* implied);
  bool parseExprList(std::vector<ExprPtr>& out);
  bool skipBalanced(std::vector<ExprPtr>& literals);
  bool scanBody(std::vector<ExprPtr>& contents);
  bool startsCompositeLiteral() const;
  ExprPtr tryParseExpr();
  ExprPtr makeLiteral(const Token& t);

  SourceFile& file_;
  std::vector<Token> toks_;
  const std::vector<SourceRange>& comments_;
  size_t idx_ = 0;
  unsigned prevEnd_ = 0;

  bool failed_ = false;
  unsigned errOffset_ = 0;
  std::string errMessage_;
};

int binaryPrecedence(const Token& t) {
  if (t.kind != TokenKind::Operator) return 0;
  llvm::StringRef op = t.text;
  if (op == "||") return 1;
  if (op == "&&") return 2;
  if (op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=") return 3;
  if (op == "+" || op == "-" || op == "|" || op == "^") return 4;
  if (op == "*" || op == "/" || op == "%" || op == "<<" || op == ">>" || op == "&" || op == "&^")
    return 5;
  return 0;
}

bool isUnaryOp(const Token& t) {
  return t.isOp("+") || t.isOp("-") || t.isOp("!") || t.isOp("^") || t.isOp("*") ||
         t.isOp("&") || t.isOp("<-") || t.isOp("~");
}

const Expr* stripParens(const Expr* e) {
  while (const auto* p = llvm::dyn_cast_or_null<ParenExpr>(e)) e = p->inner.get();
  return e;
}

// Expressions that may be followed by `{` to form a composite literal.
bool isLiteralType(const Expr* e) {
  switch (e->kind()) {
  case Expr::Kind::Ident:
  case Expr::Kind::ArrayType:
  case Expr::Kind::MapType:
  case Expr::Kind::Opaque:
    return true;
  case Expr::Kind::Selector:
    return llvm::isa<Ident>(llvm::cast<SelectorExpr>(e)->base.get());
  case Expr::Kind::Index:
    return isLiteralType(llvm::cast<IndexExpr>(e)->base.get());
  case Expr::Kind::BasicLit:
  case Expr::Kind::CompositeLit:
  case Expr::Kind::KeyValue:
  case Expr::Kind::Unary:
  case Expr::Kind::Binary:
  case Expr::Kind::Call:
  case Expr::Kind::Paren:
    return false;
  }
  return false;
}

// Type of the elements of a literal of type `t` (for keys when forKey).
const Expr* elementType(const Expr* t, bool forKey) {
  t = stripParens(t);
  if (!t) return nullptr;
  if (const auto* arr = llvm::dyn_cast<ArrayTypeExpr>(t)) return forKey ? nullptr : arr->element.get();
  if (const auto* map = llvm::dyn_cast<MapTypeExpr>(t)) return forKey ? map->key.get() : map->value.get();
  return nullptr;
}

llvm::Error Parser::parse() {
  skipSemicolons();
  if (!tok().isKeyword("package")) {
    failHere("'package'");
  } else {
    file_.packageOffset = tok().offset;
    next();
    if (!tok().is(TokenKind::Ident)) {
      failHere("package name");
    } else {
      file_.packageName = tok().text.str();
      next();
    }
  }

  while (!failed_ && !tok().is(TokenKind::Eof)) {
    if (tok().is(TokenKind::Semicolon)) { next(); continue; }
    if (tok().isKeyword("var") || tok().isKeyword("const")) parseValueDecl();
    else if (tok().isKeyword("import") || tok().isKeyword("type") || tok().isKeyword("func"))
      parseOpaqueDecl();
    else
      failHere("declaration");
    if (!failed_ && !tok().is(TokenKind::Semicolon) && !tok().is(TokenKind::Eof))
      failHere("';' or newline after declaration");
  }

  if (failed_) return syntaxError(file_.path, file_.position(errOffset_), errMessage_);
  attachDocComments();
  return llvm::Error::success();
}

void Parser::parseValueDecl() {
  auto decl = std::make_unique<ValueDecl>();
  decl->isConst = tok().isKeyword("const");
  unsigned begin = tok().offset;
  next();

  if (tok().isOp("(")) {
    decl->grouped = true;
    next();
    while (!failed_) {
      skipSemicolons();
      if (tok().isOp(")")) break;
      ValueSpec spec;
      if (!parseValueSpec(spec)) return;
      decl->specs.push_back(std::move(spec));
      if (!tok().is(TokenKind::Semicolon) && !tok().isOp(")")) {
        failHere("';' or ')'");
        return;
      }
    }
    if (!expectOp(")")) return;
  } else {
    ValueSpec spec;
    if (!parseValueSpec(spec)) return;
    decl->specs.push_back(std::move(spec));
  }

  decl->range = SourceRange{begin, prevEnd_};
  decl->docBegin = begin;
  file_.decls.push_back(std::move(decl));
}

bool Parser::parseValueSpec(ValueSpec& spec) {
  spec.range.begin = tok().offset;
  while (true) {
    if (!tok().is(TokenKind::Ident)) {
      failHere("identifier");
      return false;
    }
    spec.names.push_back(DeclName{tok().text.str(), tok().offset});
    next();
    if (!tok().isOp(",")) break;
    next();
  }

  if (!tok().isOp("=") && !tok().is(TokenKind::Semicolon) && !tok().isOp(")") &&
      !tok().is(TokenKind::Eof)) {
    spec.type = parseType();
    if (!spec.type) return false;
  }
  if (tok().isOp("=")) {
    next();
    if (!parseExprList(spec.values)) return false;
  }
  spec.range.end = prevEnd_;
  return !failed_;
}

void Parser::parseOpaqueDecl() {
  OpaqueDecl::Keyword kw = tok().isKeyword("import") ? OpaqueDecl::Keyword::Import
                         : tok().isKeyword("type")   ? OpaqueDecl::Keyword::Type
                                                     : OpaqueDecl::Keyword::Func;
  auto decl = std::make_unique<OpaqueDecl>(kw);
  unsigned begin = tok().offset;
  next();

  int depth = 0;
  while (!tok().is(TokenKind::Eof)) {
    const Token& t = tok();
    if (depth == 0 && t.is(TokenKind::Semicolon)) break;
    if (depth == 0 && t.isOp("{") && kw == OpaqueDecl::Keyword::Func) {
      if (!scanBody(decl->contents)) return;
      continue;
    }
    if (t.isOp("(") || t.isOp("[") || t.isOp("{")) ++depth;
    if (t.isOp(")") || t.isOp("]") || t.isOp("}")) {
      if (--depth < 0) {
        fail(t.offset, "unbalanced '" + t.text + "'");
        return;
      }
    }
    if (t.is(TokenKind::String)) decl->contents.push_back(makeLiteral(t));
    next();
  }
  if (depth != 0) {
    fail(begin, "declaration is not terminated");
    return;
  }

  decl->range = SourceRange{begin, prevEnd_};
  decl->docBegin = begin;
  file_.decls.push_back(std::move(decl));
}

// A comment group ending on the line directly above a declaration, and
// not trailing other code, documents it.
void Parser::attachDocComments() {
  llvm::StringRef text = file_.text;
  for (auto& decl : file_.decls) {
    unsigned docBegin = decl->range.begin;
    for (auto it = comments_.rbegin(); it != comments_.rend(); ++it) {
      if (it->end > docBegin) continue;
      llvm::StringRef gap = text.slice(it->end, docBegin);
      if (!gap.trim(" \t\r\n").empty() || gap.count('\n') > 1) break;
      unsigned lineBegin = file_.lines.lineStart(file_.position(it->begin).line);
      if (!text.slice(lineBegin, it->begin).trim(" \t").empty()) break;
      docBegin = it->begin;
    }
    decl->docBegin = docBegin;
  }
}

bool Parser::parseExprList(std::vector<ExprPtr>& out) {
  while (true) {
    ExprPtr e = parseExpr();
    if (!e) return false;
    out.push_back(std::move(e));
    if (!tok().isOp(",")) return true;
    next();
  }
}

ExprPtr Parser::parseBinary(int minPrec) {
  unsigned begin = tok().offset;
  ExprPtr lhs = parseUnary();
  if (!lhs) return nullptr;
  while (true) {
    int prec = binaryPrecedence(tok());
    if (prec < minPrec || prec == 0) return lhs;
    std::string op = tok().text.str();
    next();
    ExprPtr rhs = parseBinary(prec + 1);
    if (!rhs) return nullptr;
    lhs = finish(std::make_unique<BinaryExpr>(std::move(op), std::move(lhs), std::move(rhs)), begin);
  }
}

ExprPtr Parser::parseUnary() {
  if (isUnaryOp(tok())) {
    unsigned begin = tok().offset;
    std::string op = tok().text.str();
    next();
    ExprPtr operand = parseUnary();
    if (!operand) return nullptr;
    return finish(std::make_unique<UnaryExpr>(std::move(op), std::move(operand)), begin);
  }
  return parsePrimary();
}

ExprPtr Parser::parsePrimary() {
  unsigned begin = tok().offset;
  ExprPtr x = parseOperand();
  while (x && !failed_) {
    if (tok().isOp(".")) {
      next();
      if (!tok().is(TokenKind::Ident)) return failHere("selector");
      std::string field = tok().text.str();
      next();
      x = finish(std::make_unique<SelectorExpr>(std::move(x), std::move(field)), begin);
    } else if (tok().isOp("[")) {
      next();
      auto index = std::make_unique<IndexExpr>(std::move(x));
      while (!tok().isOp("]")) {
        if (tok().isOp(":")) { next(); continue; }
        ExprPtr i = parseExpr();
        if (!i) return nullptr;
        index->indices.push_back(std::move(i));
        if (tok().isOp(",") || tok().isOp(":")) { next(); continue; }
        if (!tok().isOp("]")) return failHere("']'");
      }
      next();
      x = finish(std::move(index), begin);
    } else if (tok().isOp("(")) {
      next();
      auto call = std::make_unique<CallExpr>(std::move(x));
      while (!tok().isOp(")")) {
        ExprPtr arg = parseExpr();
        if (!arg) return nullptr;
        call->args.push_back(std::move(arg));
        if (tok().isOp("...")) { call->hasEllipsis = true; next(); }
        if (!tok().isOp(",")) break;
        next();
      }
      if (!expectOp(")")) return nullptr;
      x = finish(std::move(call), begin);
    } else if (tok().isOp("{") && isLiteralType(x.get())) {
      x = parseComposite(std::move(x), nullptr);
    } else {
      break;
    }
  }
  if (failed_) return nullptr;
  return x;
}

ExprPtr Parser::makeLiteral(const Token& t) {
  LitKind kind = LitKind::String;
  switch (t.kind) {
  case TokenKind::Int: kind = LitKind::Int; break;
  case TokenKind::Float: kind = LitKind::Float; break;
  case TokenKind::Imag: kind = LitKind::Imag; break;
  case TokenKind::Char: kind = LitKind::Char; break;
  default: break;
  }
  auto lit = std::make_unique<BasicLit>(kind, t.text.str());
  lit->range = SourceRange{t.offset, t.end()};
  return lit;
}

ExprPtr Parser::parseOperand() {
  const Token& t = tok();
  if (t.isLiteral()) {
    ExprPtr lit = makeLiteral(t);
    next();
    return lit;
  }
  if (t.is(TokenKind::Ident)) {
    auto id = std::make_unique<Ident>(t.text.str());
    id->range = SourceRange{t.offset, t.end()};
    next();
    return id;
  }
  if (t.isOp("(")) {
    unsigned begin = t.offset;
    next();
    ExprPtr inner = parseExpr();
    if (!inner || !expectOp(")")) return nullptr;
    return finish(std::make_unique<ParenExpr>(std::move(inner)), begin);
  }
  if (t.isOp("[")) return parseArrayType();
  if (t.isKeyword("map")) return parseMapType();
  if (t.isKeyword("func") || t.isKeyword("struct") || t.isKeyword("interface") ||
      t.isKeyword("chan"))
    return parseOpaque();
  return failHere("expression");
}

ExprPtr Parser::parseType() {
  const Token& t = tok();
  unsigned begin = t.offset;
  if (t.isOp("*")) {
    next();
    ExprPtr inner = parseType();
    if (!inner) return nullptr;
    return finish(std::make_unique<UnaryExpr>("*", std::move(inner)), begin);
  }
  if (t.isOp("(")) {
    next();
    ExprPtr inner = parseType();
    if (!inner || !expectOp(")")) return nullptr;
    return finish(std::make_unique<ParenExpr>(std::move(inner)), begin);
  }
  if (t.isOp("[")) return parseArrayType();
  if (t.isKeyword("map")) return parseMapType();
  if (t.isKeyword("func") || t.isKeyword("struct") || t.isKeyword("interface") ||
      t.isKeyword("chan"))
    return parseOpaque();
  if (!t.is(TokenKind::Ident)) return failHere("type");

  ExprPtr type = std::make_unique<Ident>(t.text.str());
  type->range = SourceRange{t.offset, t.end()};
  next();
  if (tok().isOp(".") && peek().is(TokenKind::Ident)) {
    next();
    std::string field = tok().text.str();
    next();
    type = finish(std::make_unique<SelectorExpr>(std::move(type), std::move(field)), begin);
  }
  if (tok().isOp("[")) {
    next();
    auto inst = std::make_unique<IndexExpr>(std::move(type));
    while (!tok().isOp("]")) {
      ExprPtr arg = parseType();
      if (!arg) return nullptr;
      inst->indices.push_back(std::move(arg));
      if (!tok().isOp(",")) break;
      next();
    }
    if (!expectOp("]")) return nullptr;
    type = finish(std::move(inst), begin);
  }
  return type;
}

ExprPtr Parser::parseArrayType() {
  unsigned begin = tok().offset;
  next(); // [
  ExprPtr length;
  if (tok().isOp("...")) {
    length = std::make_unique<Ident>("...");
    length->range = SourceRange{tok().offset, tok().end()};
    next();
  } else if (!tok().isOp("]")) {
    length = parseExpr();
    if (!length) return nullptr;
  }
  if (!expectOp("]")) return nullptr;
  ExprPtr elem = parseType();
  if (!elem) return nullptr;
  return finish(std::make_unique<ArrayTypeExpr>(std::move(length), std::move(elem)), begin);
}

ExprPtr Parser::parseMapType() {
  unsigned begin = tok().offset;
  next(); // map
  if (!expectOp("[")) return nullptr;
  ExprPtr key = parseType();
  if (!key || !expectOp("]")) return nullptr;
  ExprPtr value = parseType();
  if (!value) return nullptr;
  return finish(std::make_unique<MapTypeExpr>(std::move(key), std::move(value)), begin);
}

// Consumes a bracketed group starting at the current token, keeping any
// string literals found inside.
bool Parser::skipBalanced(std::vector<ExprPtr>& literals) {
  unsigned begin = tok().offset;
  int depth = 0;
  do {
    const Token& t = tok();
    if (t.is(TokenKind::Eof)) {
      fail(begin, "unbalanced brackets");
      return false;
    }
    if (t.isOp("(") || t.isOp("[") || t.isOp("{")) ++depth;
    else if (t.isOp(")") || t.isOp("]") || t.isOp("}")) --depth;
    else if (t.is(TokenKind::String)) literals.push_back(makeLiteral(t));
    next();
  } while (depth > 0);
  return true;
}

// Parses an expression at the current token. When it does not parse, the
// position and error state are restored and null is returned.
ExprPtr Parser::tryParseExpr() {
  size_t idx = idx_;
  unsigned prevEnd = prevEnd_;
  ExprPtr e = parseExpr();
  if (e && !failed_) return e;
  idx_ = idx;
  prevEnd_ = prevEnd;
  failed_ = false;
  errMessage_.clear();
  return nullptr;
}

// T{, pkg.T{, []T{ and map[K]V{, not preceded by a selector dot.
bool Parser::startsCompositeLiteral() const {
  if (idx_ > 0 && toks_[idx_ - 1].isOp(".")) return false;
  const Token& t = tok();
  if (t.is(TokenKind::Ident)) {
    if (peek().isOp("{")) return true;
    return peek().isOp(".") && peek(2).is(TokenKind::Ident) && peek(3).isOp("{");
  }
  if (t.isOp("[")) return peek().isOp("]");
  return t.isKeyword("map") && peek().isOp("[");
}

// Consumes a function body starting at '{'. Expressions that begin with a
// composite literal are kept along with stray string literals; the
// statements around them are skipped. A block such as `if ok {}` may parse
// as a literal typed `ok`, which no rule recognises.
bool Parser::scanBody(std::vector<ExprPtr>& contents) {
  unsigned begin = tok().offset;
  int depth = 0;
  do {
    const Token& t = tok();
    if (t.is(TokenKind::Eof)) {
      fail(begin, "unbalanced brackets");
      return false;
    }
    if (depth > 0 && startsCompositeLiteral()) {
      if (ExprPtr e = tryParseExpr()) {
        contents.push_back(std::move(e));
        continue;
      }
    }
    if (t.isOp("(") || t.isOp("[") || t.isOp("{")) ++depth;
    else if (t.isOp(")") || t.isOp("]") || t.isOp("}")) --depth;
    else if (t.is(TokenKind::String)) contents.push_back(makeLiteral(t));
    next();
  } while (depth > 0);
  return true;
}

ExprPtr Parser::parseOpaque() {
  unsigned begin = tok().offset;
  auto opaque = std::make_unique<OpaqueExpr>();

  if (tok().isKeyword("struct") || tok().isKeyword("interface")) {
    next();
    if (!tok().isOp("{")) return failHere("'{'");
    if (!skipBalanced(opaque->contents)) return nullptr;
    return finish(std::move(opaque), begin);
  }

  if (tok().isKeyword("chan")) {
    next();
    if (tok().isOp("<-")) next();
    ExprPtr elem = parseType();
    if (!elem) return nullptr;
    return finish(std::move(opaque), begin);
  }

  // func signature, then an optional body
  next();
  if (tok().isOp("[") && !skipBalanced(opaque->contents)) return nullptr;
  if (!tok().isOp("(")) return failHere("'('");
  if (!skipBalanced(opaque->contents)) return nullptr;
  if (tok().isOp("(")) {
    if (!skipBalanced(opaque->contents)) return nullptr;
  } else if (!tok().isOp("{") && !tok().isOp(",") && !tok().isOp(")") && !tok().isOp("]") &&
             !tok().isOp("}") && !tok().isOp("=") && !tok().is(TokenKind::Semicolon) &&
             !tok().is(TokenKind::Eof)) {
    if (!parseType()) return nullptr;
  }
  if (tok().isOp("{") && !scanBody(opaque->contents)) return nullptr;
  return finish(std::move(opaque), begin);
}

ExprPtr Parser::parseComposite(ExprPtr type, const Expr* implied) {
  unsigned begin = type ? type->range.begin : tok().offset;

  // For elided literals the parent spells the type; *T means &T{...}.
  const Expr* litType = type.get();
  bool pointer = false;
  if (!litType && implied) {
    litType = stripParens(implied);
    if (const auto* star = llvm::dyn_cast<UnaryExpr>(litType)) {
      if (star->op == "*") {
        pointer = true;
        litType = stripParens(star->operand.get());
      }
    }
  }

  auto lit = std::make_unique<CompositeLit>(std::move(type));
  if (!lit->type && litType) {
    lit->impliedType = file_.slice(litType->range).str();
    lit->impliedPointer = pointer;
  }

  const Expr* keyImplied = elementType(litType, true);
  const Expr* valueImplied = elementType(litType, false);

  lit->lbrace = tok().offset;
  if (!expectOp("{")) return nullptr;
  while (!tok().isOp("}")) {
    ExprPtr element;
    unsigned elemBegin = tok().offset;
    ExprPtr first = tok().isOp("{") ? parseComposite(nullptr, keyImplied ? keyImplied : valueImplied)
                                    : parseExpr();
    if (!first) return nullptr;
    if (tok().isOp(":")) {
      next();
      ExprPtr value = tok().isOp("{") ? parseComposite(nullptr, valueImplied) : parseExpr();
      if (!value) return nullptr;
      element = finish(std::make_unique<KeyValueExpr>(std::move(first), std::move(value)), elemBegin);
    } else {
      element = std::move(first);
    }
    lit->elements.push_back(std::move(element));
    if (!tok().isOp(",")) break;
    next();
  }
  lit->rbrace = tok().offset;
  if (!expectOp("}")) return nullptr;
  return finish(std::move(lit), begin);
}

} // namespace

llvm::Expected<std::unique_ptr<SourceFile>> parseSource(std::string path, std::string text) {
  auto file = std::make_unique<SourceFile>();
  file->path = std::move(path);
  file->text = std::move(text);
  file->lines = LineTable(file->text);

  Lexer lexer(file->path, file->text, file->lines);
  auto tokens = lexer.tokenize();
  if (!tokens) return tokens.takeError();

  Parser parser(*file, std::move(*tokens), lexer.comments());
  if (auto err = parser.parse()) return std::move(err);
  return std::move(file);
}

llvm::Expected<std::unique_ptr<SourceFile>> parseFile(llvm::StringRef path) {
  auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
  if (!buffer) {
    return llvm::createStringError(buffer.getError(), "failed to read %s: %s",
                                   path.str().c_str(), buffer.getError().message().c_str());
  }
  return parseSource(path.str(), (*buffer)->getBuffer().str());
}

} // namespace syntax
} // namespace kwl
