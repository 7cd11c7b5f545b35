#include "syntax/Lexer.hpp"
#include <gtest/gtest.h>

using namespace kwl::syntax;

class LexerTest : public ::testing::Test {
protected:
  // Keep the text alive so Token::text stays valid.
  std::string text_;
  std::unique_ptr<LineTable> lines_;

  std::vector<Token> lex(const std::string& code) {
    text_ = code;
    lines_ = std::make_unique<LineTable>(text_);
    Lexer lexer("test.go", text_, *lines_);
    auto tokens = lexer.tokenize();
    if (!tokens) {
      ADD_FAILURE() << llvm::toString(tokens.takeError());
      return {};
    }
    return std::move(*tokens);
  }

  std::string lexError(const std::string& code) {
    text_ = code;
    lines_ = std::make_unique<LineTable>(text_);
    Lexer lexer("test.go", text_, *lines_);
    auto tokens = lexer.tokenize();
    if (tokens) return std::string();
    return llvm::toString(tokens.takeError());
  }

  std::vector<TokenKind> kinds(const std::string& code) {
    std::vector<TokenKind> out;
    for (const Token& t : lex(code)) out.push_back(t.kind);
    return out;
  }
};

TEST_F(LexerTest, KeywordsAndIdentifiers) {
  auto tokens = lex("var deploy");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_TRUE(tokens[0].isKeyword("var"));
  EXPECT_EQ(tokens[1].kind, TokenKind::Ident);
  EXPECT_EQ(tokens[1].text, "deploy");
  EXPECT_EQ(tokens[2].kind, TokenKind::Semicolon);
  EXPECT_EQ(tokens[3].kind, TokenKind::Eof);
}

TEST_F(LexerTest, InsertsSemicolonAfterLineEndingTokens) {
  EXPECT_EQ(kinds("x\n"), (std::vector<TokenKind>{TokenKind::Ident, TokenKind::Semicolon,
                                                   TokenKind::Eof}));
  EXPECT_EQ(kinds("}\n"), (std::vector<TokenKind>{TokenKind::Operator, TokenKind::Semicolon,
                                                   TokenKind::Eof}));
  EXPECT_EQ(kinds("\"s\"\n"), (std::vector<TokenKind>{TokenKind::String, TokenKind::Semicolon,
                                                       TokenKind::Eof}));
}

TEST_F(LexerTest, NoSemicolonAfterOpenersAndCommas) {
  EXPECT_EQ(kinds("{\n"), (std::vector<TokenKind>{TokenKind::Operator, TokenKind::Eof}));
  EXPECT_EQ(kinds("a,\nb"), (std::vector<TokenKind>{TokenKind::Ident, TokenKind::Operator,
                                                     TokenKind::Ident, TokenKind::Semicolon,
                                                     TokenKind::Eof}));
}

TEST_F(LexerTest, CommentsAreNotTokens) {
  auto tokens = lex("a // trailing\n/* block */ b");
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].text, "a");
  EXPECT_EQ(tokens[1].kind, TokenKind::Semicolon);
  EXPECT_EQ(tokens[2].text, "b");
}

TEST_F(LexerTest, MultiLineBlockCommentActsAsNewline) {
  auto tokens = lex("a /* one\ntwo */ b");
  ASSERT_GE(tokens.size(), 3u);
  EXPECT_EQ(tokens[1].kind, TokenKind::Semicolon);
}

TEST_F(LexerTest, NumberLiterals) {
  auto tokens = lex("42 0x1F 1_000 3.14 1e9 2i 'a'");
  ASSERT_EQ(tokens.size(), 9u);
  EXPECT_EQ(tokens[0].kind, TokenKind::Int);
  EXPECT_EQ(tokens[1].kind, TokenKind::Int);
  EXPECT_EQ(tokens[1].text, "0x1F");
  EXPECT_EQ(tokens[2].kind, TokenKind::Int);
  EXPECT_EQ(tokens[3].kind, TokenKind::Float);
  EXPECT_EQ(tokens[4].kind, TokenKind::Float);
  EXPECT_EQ(tokens[5].kind, TokenKind::Imag);
  EXPECT_EQ(tokens[6].kind, TokenKind::Char);
}

TEST_F(LexerTest, StringLiterals) {
  auto tokens = lex("\"a\\\"b\" `raw\nstring`");
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0].kind, TokenKind::String);
  EXPECT_EQ(tokens[0].text, "\"a\\\"b\"");
  EXPECT_EQ(tokens[1].kind, TokenKind::String);
  EXPECT_EQ(tokens[1].text, "`raw\nstring`");
}

TEST_F(LexerTest, LongestOperatorWins) {
  auto tokens = lex("a &^= b ... <-c");
  ASSERT_GE(tokens.size(), 6u);
  EXPECT_TRUE(tokens[1].isOp("&^="));
  EXPECT_TRUE(tokens[3].isOp("..."));
  EXPECT_TRUE(tokens[4].isOp("<-"));
}

TEST_F(LexerTest, ReportsUnterminatedString) {
  std::string err = lexError("package main\nvar x = \"open\n");
  EXPECT_EQ(err, "test.go:2:9: string literal not terminated");
}

TEST_F(LexerTest, ReportsInvalidCharacter) {
  std::string err = lexError("a $ b");
  EXPECT_EQ(err, "test.go:1:3: invalid character '$'");
}

TEST_F(LexerTest, ReportsUnterminatedComment) {
  EXPECT_NE(lexError("/* never closed").find("comment not terminated"), std::string::npos);
}
