// fieldcalc/syntax/token.hpp - Token kinds of the formula language
#pragma once

#include <cstdint>
#include <string_view>

#include "fieldcalc/basic/source_manager.hpp"

namespace fieldcalc::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Identifier,
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.text is the string *contents* (without quotes, escapes not applied)

  // Keywords (matched case-insensitively)
  KwTrue,
  KwFalse,
  KwNull,
  KwAnd,
  KwOr,
  KwNot,

  // Punctuation / operators
  LParen,
  RParen,
  Comma,

  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,

  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the formula (including quotes for strings)
  std::string_view text;  // slice view (for StringLiteral: interior)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::KwTrue:
      return "true";
    case TokenKind::KwFalse:
      return "false";
    case TokenKind::KwNull:
      return "null";
    case TokenKind::KwAnd:
      return "and";
    case TokenKind::KwOr:
      return "or";
    case TokenKind::KwNot:
      return "not";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "";
}

}  // namespace fieldcalc::syntax
