#pragma once
#include "syntax/Source.hpp"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace kwl {
namespace syntax {

enum class TokenKind {
  Eof,
  Semicolon,   // explicit ';' or inserted at a line break
  Ident,
  Keyword,
  Int,
  Float,
  Imag,
  Char,
  String,
  Operator,
};

struct Token {
  TokenKind kind = TokenKind::Eof;
  unsigned offset = 0;
  unsigned length = 0;
  llvm::StringRef text;     // empty for inserted semicolons

  unsigned end() const { return offset + length; }
  bool is(TokenKind k) const { return kind == k; }
  bool isOp(llvm::StringRef op) const { return kind == TokenKind::Operator && text == op; }
  bool isKeyword(llvm::StringRef kw) const { return kind == TokenKind::Keyword && text == kw; }
  bool isLiteral() const {
    return kind == TokenKind::Int || kind == TokenKind::Float || kind == TokenKind::Imag ||
           kind == TokenKind::Char || kind == TokenKind::String;
  }
};

// Tokenizer for Go source with automatic semicolon insertion. Comments are
// not tokens; their ranges are collected separately.
class Lexer {
public:
  Lexer(llvm::StringRef path, llvm::StringRef text, const LineTable& lines);

  llvm::Expected<std::vector<Token>> tokenize();
  const std::vector<SourceRange>& comments() const { return comments_; }

private:
  bool needsSemicolon() const;
  void push(TokenKind kind, unsigned begin, unsigned end);
  void pushSemicolon(unsigned at);
  llvm::Error error(unsigned offset, const llvm::Twine& message) const;

  llvm::Error lexNumber();
  llvm::Error lexQuoted(char quote, TokenKind kind);
  llvm::Error lexRawString();
  void lexIdentifier();
  bool lexOperator();

  llvm::StringRef path_;
  llvm::StringRef text_;
  const LineTable& lines_;
  unsigned pos_ = 0;
  std::vector<Token> tokens_;
  std::vector<SourceRange> comments_;
};

bool isKeyword(llvm::StringRef word);

} // namespace syntax
} // namespace kwl
