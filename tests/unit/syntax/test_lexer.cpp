#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "filament/syntax/lexer.hpp"
#include "filament/syntax/token.hpp"

using filament::FileId;
using filament::syntax::Lexer;
using filament::syntax::Token;
using filament::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds(std::string_view src)
{
  Lexer lex(FileId{0}, src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, PunctuationOfSignatures)
{
  const auto k = kinds("comp A[W]<G: 1>(x: [G, G+1] W) -> (y: [G, G+1] W);");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::LBracket, TokenKind::Identifier,
    TokenKind::RBracket,   TokenKind::Lt,         TokenKind::Identifier, TokenKind::Colon,
    TokenKind::IntLiteral, TokenKind::Gt,         TokenKind::LParen,   TokenKind::Identifier,
    TokenKind::Colon,      TokenKind::LBracket,   TokenKind::Identifier, TokenKind::Comma,
    TokenKind::Identifier, TokenKind::Plus,       TokenKind::IntLiteral, TokenKind::RBracket,
    TokenKind::Identifier, TokenKind::RParen,     TokenKind::Arrow,    TokenKind::LParen,
    TokenKind::Identifier, TokenKind::Colon,      TokenKind::LBracket, TokenKind::Identifier,
    TokenKind::Comma,      TokenKind::Identifier, TokenKind::Plus,     TokenKind::IntLiteral,
    TokenKind::RBracket,   TokenKind::Identifier, TokenKind::RParen,   TokenKind::Semicolon,
    TokenKind::Eof,
  };
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, MultiCharacterOperators)
{
  const auto k = kinds(":= -> == != <= >= = < >");
  const std::vector<TokenKind> expected = {
    TokenKind::ColonEq, TokenKind::Arrow, TokenKind::EqEq, TokenKind::Ne, TokenKind::Le,
    TokenKind::Ge,      TokenKind::Eq,    TokenKind::Lt,   TokenKind::Gt, TokenKind::Eof,
  };
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, CommentsAreSkipped)
{
  const auto k = kinds(
    "// line comment\n"
    "exists /* inline */ L; // trailing\n");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::Semicolon, TokenKind::Eof};
  EXPECT_EQ(k, expected);
}

TEST(SyntaxLexer, TokenTextAndRanges)
{
  const std::string_view src = "M3 := new Mul[32, 3];";
  Lexer lex(FileId{0}, src);
  const auto toks = lex.lex_all();
  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[0].text, "M3");
  EXPECT_EQ(toks[0].begin(), 0U);
  EXPECT_EQ(toks[0].end(), 2U);
  EXPECT_EQ(toks[1].kind, TokenKind::ColonEq);
  EXPECT_EQ(toks[2].text, "new");
  EXPECT_EQ(toks[3].text, "Mul");

  int ints = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::IntLiteral) {
      ++ints;
    }
  }
  EXPECT_EQ(ints, 2);
}

TEST(SyntaxLexer, StringLiteralForImports)
{
  Lexer lex(FileId{0}, "import \"lib/mul.fil\";");
  const auto toks = lex.lex_all();
  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[1].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[1].text, "lib/mul.fil");
}

TEST(SyntaxLexer, UnterminatedBlockCommentIsUnknown)
{
  const auto k = kinds("comp /* never closed");
  ASSERT_GE(k.size(), 2U);
  EXPECT_EQ(k[0], TokenKind::Identifier);
  EXPECT_EQ(k[1], TokenKind::Unknown);
  EXPECT_EQ(k.back(), TokenKind::Eof);
}
