#include "syntax/Lexer.hpp"
#include "llvm/ADT/StringSwitch.h"
#include <cctype>

namespace kwl {
namespace syntax {

bool isKeyword(llvm::StringRef word) {
  return llvm::StringSwitch<bool>(word)
    .Cases("break", "case", "chan", "const", "continue", true)
    .Cases("default", "defer", "else", "fallthrough", "for", true)
    .Cases("func", "go", "goto", "if", "import", true)
    .Cases("interface", "map", "package", "range", "return", true)
    .Cases("select", "struct", "switch", "type", "var", true)
    .Default(false);
}

static bool isLetter(char c) {
  return std::isalpha((unsigned char)c) || c == '_' || (unsigned char)c >= 0x80;
}

static bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Longest first so that prefixes never shadow longer operators.
static const char* const kOperators[] = {
  "<<=", ">>=", "&^=", "...",
  "&&", "||", "<-", "++", "--", "==", "!=", "<=", ">=", ":=",
  "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "<<", ">>", "&^",
  "+", "-", "*", "/", "%", "&", "|", "^", "<", ">", "=", "!", "~",
  "(", ")", "[", "]", "{", "}", ",", ".", ":",
};

Lexer::Lexer(llvm::StringRef path, llvm::StringRef text, const LineTable& lines)
  : path_(path), text_(text), lines_(lines) {}

llvm::Error Lexer::error(unsigned offset, const llvm::Twine& message) const {
  return syntaxError(path_, lines_.position(offset), message);
}

bool Lexer::needsSemicolon() const {
  if (tokens_.empty()) return false;
  const Token& last = tokens_.back();
  switch (last.kind) {
  case TokenKind::Ident:
  case TokenKind::Int:
  case TokenKind::Float:
  case TokenKind::Imag:
  case TokenKind::Char:
  case TokenKind::String:
    return true;
  case TokenKind::Keyword:
    return last.text == "break" || last.text == "continue" ||
           last.text == "fallthrough" || last.text == "return";
  case TokenKind::Operator:
    return last.text == "++" || last.text == "--" || last.text == ")" ||
           last.text == "]" || last.text == "}";
  case TokenKind::Eof:
  case TokenKind::Semicolon:
    return false;
  }
  return false;
}

void Lexer::push(TokenKind kind, unsigned begin, unsigned end) {
  Token t;
  t.kind = kind;
  t.offset = begin;
  t.length = end - begin;
  t.text = text_.slice(begin, end);
  tokens_.push_back(t);
}

void Lexer::pushSemicolon(unsigned at) {
  Token t;
  t.kind = TokenKind::Semicolon;
  t.offset = at;
  t.length = 0;
  tokens_.push_back(t);
}

llvm::Expected<std::vector<Token>> Lexer::tokenize() {
  tokens_.clear();
  comments_.clear();
  pos_ = 0;

  while (pos_ < text_.size()) {
    char c = text_[pos_];

    if (c == '\n') {
      if (needsSemicolon()) pushSemicolon(pos_);
      ++pos_;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r') { ++pos_; continue; }

    if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '/') {
      unsigned begin = pos_;
      size_t nl = text_.find('\n', pos_);
      pos_ = nl == llvm::StringRef::npos ? (unsigned)text_.size() : (unsigned)nl;
      comments_.push_back(SourceRange{begin, pos_});
      continue;
    }
    if (c == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '*') {
      unsigned begin = pos_;
      size_t close = text_.find("*/", pos_ + 2);
      if (close == llvm::StringRef::npos) return error(begin, "comment not terminated");
      pos_ = (unsigned)close + 2;
      comments_.push_back(SourceRange{begin, pos_});
      // A general comment spanning lines acts like a newline.
      if (text_.slice(begin, pos_).contains('\n') && needsSemicolon()) pushSemicolon(begin);
      continue;
    }

    if (isLetter(c)) { lexIdentifier(); continue; }
    if (isDigit(c) || (c == '.' && pos_ + 1 < text_.size() && isDigit(text_[pos_ + 1]))) {
      if (auto err = lexNumber()) return std::move(err);
      continue;
    }
    if (c == '"') {
      if (auto err = lexQuoted('"', TokenKind::String)) return std::move(err);
      continue;
    }
    if (c == '\'') {
      if (auto err = lexQuoted('\'', TokenKind::Char)) return std::move(err);
      continue;
    }
    if (c == '`') {
      if (auto err = lexRawString()) return std::move(err);
      continue;
    }
    if (c == ';') {
      push(TokenKind::Semicolon, pos_, pos_ + 1);
      ++pos_;
      continue;
    }
    if (lexOperator()) continue;

    return error(pos_, llvm::Twine("invalid character '") + llvm::Twine(c) + "'");
  }

  if (needsSemicolon()) pushSemicolon(pos_);
  Token eof;
  eof.kind = TokenKind::Eof;
  eof.offset = pos_;
  tokens_.push_back(eof);
  return std::move(tokens_);
}

void Lexer::lexIdentifier() {
  unsigned begin = pos_;
  while (pos_ < text_.size() && (isLetter(text_[pos_]) || isDigit(text_[pos_]))) ++pos_;
  llvm::StringRef word = text_.slice(begin, pos_);
  push(isKeyword(word) ? TokenKind::Keyword : TokenKind::Ident, begin, pos_);
}

llvm::Error Lexer::lexNumber() {
  unsigned begin = pos_;
  bool isFloat = false;
  auto digits = [&](bool hex) {
    while (pos_ < text_.size()) {
      char d = text_[pos_];
      if (isDigit(d) || d == '_' || (hex && std::isxdigit((unsigned char)d))) ++pos_;
      else break;
    }
  };

  if (text_[pos_] == '0' && pos_ + 1 < text_.size() &&
      llvm::StringRef("xXbBoO").contains(text_[pos_ + 1])) {
    bool hex = text_[pos_ + 1] == 'x' || text_[pos_ + 1] == 'X';
    pos_ += 2;
    digits(hex);
    if (hex && pos_ < text_.size() && text_[pos_] == '.') { ++pos_; digits(true); isFloat = true; }
    if (hex && pos_ < text_.size() && (text_[pos_] == 'p' || text_[pos_] == 'P')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      digits(false);
      isFloat = true;
    }
  } else {
    digits(false);
    if (pos_ < text_.size() && text_[pos_] == '.') { ++pos_; digits(false); isFloat = true; }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (pos_ >= text_.size() || !isDigit(text_[pos_]))
        return error(begin, "exponent has no digits");
      digits(false);
      isFloat = true;
    }
  }

  if (pos_ < text_.size() && text_[pos_] == 'i') {
    ++pos_;
    push(TokenKind::Imag, begin, pos_);
    return llvm::Error::success();
  }
  push(isFloat ? TokenKind::Float : TokenKind::Int, begin, pos_);
  return llvm::Error::success();
}

llvm::Error Lexer::lexQuoted(char quote, TokenKind kind) {
  unsigned begin = pos_++;
  while (pos_ < text_.size()) {
    char c = text_[pos_];
    if (c == '\n') break;
    if (c == '\\') { pos_ += 2; continue; }
    ++pos_;
    if (c == quote) {
      push(kind, begin, pos_);
      return llvm::Error::success();
    }
  }
  return error(begin, quote == '"' ? "string literal not terminated"
                                   : "rune literal not terminated");
}

llvm::Error Lexer::lexRawString() {
  unsigned begin = pos_;
  size_t close = text_.find('`', pos_ + 1);
  if (close == llvm::StringRef::npos) return error(begin, "raw string literal not terminated");
  pos_ = (unsigned)close + 1;
  push(TokenKind::String, begin, pos_);
  return llvm::Error::success();
}

bool Lexer::lexOperator() {
  llvm::StringRef rest = text_.substr(pos_);
  for (const char* op : kOperators) {
    if (rest.startswith(op)) {
      unsigned len = (unsigned)llvm::StringRef(op).size();
      push(TokenKind::Operator, pos_, pos_ + len);
      pos_ += len;
      return true;
    }
  }
  return false;
}

} // namespace syntax
} // namespace kwl
