#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "fieldcalc/syntax/lexer.hpp"
#include "fieldcalc/syntax/token.hpp"

using fieldcalc::ErrorKind;
using fieldcalc::syntax::Lexer;
using fieldcalc::syntax::Token;
using fieldcalc::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds_of(std::string_view src)
{
  std::vector<TokenKind> out;
  auto toks = fieldcalc::syntax::tokenize(src);
  if (!toks) {
    ADD_FAILURE() << "tokenize failed: " << toks.error().message;
    return out;
  }
  for (const auto & t : *toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, EmptyInputYieldsOnlyEof)
{
  const auto toks = Lexer("   \t\n").lex_all();
  ASSERT_TRUE(toks);
  ASSERT_EQ(toks->size(), 1U);
  EXPECT_EQ(toks->front().kind, TokenKind::Eof);
  EXPECT_EQ(toks->front().begin(), 5U);
  EXPECT_EQ(toks->front().end(), 5U);
}

TEST(SyntaxLexer, OperatorsPreferLongestMatch)
{
  const std::vector<TokenKind> expected = {
    TokenKind::StarStar, TokenKind::Star, TokenKind::EqEq,    TokenKind::Ne,
    TokenKind::Le,       TokenKind::Lt,   TokenKind::Ge,      TokenKind::Gt,
    TokenKind::Plus,     TokenKind::Minus, TokenKind::Slash,  TokenKind::Percent,
    TokenKind::LParen,   TokenKind::RParen, TokenKind::Comma, TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of("** * == != <= < >= > + - / % ( ) ,"), expected);
}

TEST(SyntaxLexer, NumbersDistinguishIntegerAndFloat)
{
  const auto toks = Lexer("42 3.14 1e3 2.5E-2 7e").lex_all();
  ASSERT_TRUE(toks);
  ASSERT_EQ(toks->size(), 7U);

  EXPECT_EQ((*toks)[0].kind, TokenKind::IntLiteral);
  EXPECT_EQ((*toks)[0].text, "42");
  EXPECT_EQ((*toks)[1].kind, TokenKind::FloatLiteral);
  EXPECT_EQ((*toks)[1].text, "3.14");
  EXPECT_EQ((*toks)[2].kind, TokenKind::FloatLiteral);
  EXPECT_EQ((*toks)[2].text, "1e3");
  EXPECT_EQ((*toks)[3].kind, TokenKind::FloatLiteral);
  EXPECT_EQ((*toks)[3].text, "2.5E-2");

  // An exponent marker without digits ends the number
  EXPECT_EQ((*toks)[4].kind, TokenKind::IntLiteral);
  EXPECT_EQ((*toks)[4].text, "7");
  EXPECT_EQ((*toks)[5].kind, TokenKind::Identifier);
  EXPECT_EQ((*toks)[5].text, "e");
}

TEST(SyntaxLexer, TrailingDotIsRejected)
{
  const auto toks = Lexer("7.").lex_all();
  ASSERT_FALSE(toks);
  EXPECT_EQ(toks.error().message, "unexpected character '.'");
}

TEST(SyntaxLexer, KeywordsAreCaseInsensitive)
{
  const std::vector<TokenKind> expected = {
    TokenKind::KwTrue, TokenKind::KwFalse, TokenKind::KwNull, TokenKind::KwAnd,
    TokenKind::KwOr,   TokenKind::KwNot,   TokenKind::Identifier, TokenKind::Eof,
  };
  EXPECT_EQ(kinds_of("TRUE False nUlL AND Or not notable"), expected);
}

TEST(SyntaxLexer, IdentifiersKeepTheirSpelling)
{
  const auto toks = Lexer("_tmp Price2").lex_all();
  ASSERT_TRUE(toks);
  ASSERT_EQ(toks->size(), 3U);
  EXPECT_EQ((*toks)[0].text, "_tmp");
  EXPECT_EQ((*toks)[1].text, "Price2");
  EXPECT_EQ((*toks)[1].begin(), 5U);
  EXPECT_EQ((*toks)[1].end(), 11U);
}

TEST(SyntaxLexer, StringTokenTextIsTheRawInterior)
{
  const auto toks = Lexer(R"("a\"b" 'c')").lex_all();
  ASSERT_TRUE(toks);
  ASSERT_EQ(toks->size(), 3U);

  const Token & dq = (*toks)[0];
  EXPECT_EQ(dq.kind, TokenKind::StringLiteral);
  EXPECT_EQ(dq.text, R"(a\"b)");
  EXPECT_EQ(dq.begin(), 0U);
  EXPECT_EQ(dq.end(), 6U);

  const Token & sq = (*toks)[1];
  EXPECT_EQ(sq.kind, TokenKind::StringLiteral);
  EXPECT_EQ(sq.text, "c");
}

TEST(SyntaxLexer, UnterminatedStringIsAnError)
{
  const auto toks = Lexer("x + \"abc").lex_all();
  ASSERT_FALSE(toks);
  EXPECT_EQ(toks.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(toks.error().message, "unterminated string literal");
  EXPECT_EQ(toks.error().range.get_begin().get_offset(), 4U);
  EXPECT_EQ(toks.error().range.get_end().get_offset(), 8U);
}

TEST(SyntaxLexer, UnexpectedCharacterReportsItsPosition)
{
  const auto toks = Lexer("a $ b").lex_all();
  ASSERT_FALSE(toks);
  EXPECT_EQ(toks.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(toks.error().message, "unexpected character '$'");
  EXPECT_EQ(toks.error().range.get_begin().get_offset(), 2U);
  EXPECT_EQ(toks.error().range.get_end().get_offset(), 3U);
}

TEST(SyntaxLexer, LoneBangAndEqualsAreRejected)
{
  EXPECT_FALSE(Lexer("a ! b").lex_all());
  EXPECT_FALSE(Lexer("a = b").lex_all());
}
