#include "fieldcalc/syntax/lexer.hpp"

#include <fmt/core.h>

#include <cctype>

namespace fieldcalc::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(unsigned char c) { return std::isdigit(c) != 0; }

bool iequals(std::string_view text, std::string_view keyword)
{
  if (text.size() != keyword.size()) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[i])) != keyword[i]) {
      return false;
    }
  }
  return true;
}

TokenKind classify_identifier(std::string_view text)
{
  if (iequals(text, "true")) return TokenKind::KwTrue;
  if (iequals(text, "false")) return TokenKind::KwFalse;
  if (iequals(text, "null")) return TokenKind::KwNull;
  if (iequals(text, "and")) return TokenKind::KwAnd;
  if (iequals(text, "or")) return TokenKind::KwOr;
  if (iequals(text, "not")) return TokenKind::KwNot;
  return TokenKind::Identifier;
}

std::string describe_char(char c)
{
  const auto uc = static_cast<unsigned char>(c);
  if (std::isprint(uc) != 0) {
    return fmt::format("'{}'", c);
  }
  return fmt::format("'\\x{:02X}'", static_cast<unsigned>(uc));
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start, size_t len) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(start, static_cast<uint32_t>(start + len));
  t.text = src_.substr(start, len);
  return t;
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const size_t len = pos_ - start;
  return make_token(classify_identifier(src_.substr(start, len)), start, len);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
    advance(1);
  }

  bool is_float = false;

  // Fractional part: a '.' must be followed by a digit
  if (peek() == '.' && is_digit(static_cast<unsigned char>(peek(1)))) {
    is_float = true;
    advance(1);
    while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }

  // Exponent, only consumed when digits follow
  if (peek() == 'e' || peek() == 'E') {
    size_t n = 1;
    if (peek(n) == '+' || peek(n) == '-') {
      ++n;
    }
    if (is_digit(static_cast<unsigned char>(peek(n)))) {
      is_float = true;
      advance(n);
      while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
    }
  }

  return make_token(
    is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start, pos_ - start);
}

Result<Token> Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const char quote = peek();
  advance(1);

  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != quote) {
    // Skip the escaped character so an escaped quote does not end the literal
    if (peek() == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof()) {
    return FormulaError::syntax(
      "unterminated string literal", SourceRange(start, static_cast<uint32_t>(pos_)));
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);  // closing quote

  Token t;
  t.kind = TokenKind::StringLiteral;
  t.range = SourceRange(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Result<Token> Lexer::next_token()
{
  skip_whitespace();

  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make_token(TokenKind::Eof, start, 0);
  }

  const auto c = static_cast<unsigned char>(peek());

  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (is_digit(c)) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_string();
  }

  // Multi-char operators first
  struct MultiOp
  {
    std::string_view text;
    TokenKind kind;
  };
  static constexpr MultiOp k_multi_ops[] = {
    {"**", TokenKind::StarStar}, {"==", TokenKind::EqEq}, {"!=", TokenKind::Ne},
    {"<=", TokenKind::Le},       {">=", TokenKind::Ge},
  };
  for (const auto & op : k_multi_ops) {
    if (starts_with(op.text)) {
      advance(op.text.size());
      return make_token(op.kind, start, op.text.size());
    }
  }

  TokenKind kind = TokenKind::Eof;
  switch (c) {
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '*':
      kind = TokenKind::Star;
      break;
    case '/':
      kind = TokenKind::Slash;
      break;
    case '%':
      kind = TokenKind::Percent;
      break;
    case '<':
      kind = TokenKind::Lt;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    default:
      return FormulaError::syntax(
        fmt::format("unexpected character {}", describe_char(peek())),
        SourceRange(start, start + 1));
  }

  advance(1);
  return make_token(kind, start, 1);
}

Result<std::vector<Token>> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 2 + 1);

  while (true) {
    Result<Token> t = next_token();
    if (!t) {
      return std::move(t).error();
    }
    out.push_back(*t);
    if (t->kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace fieldcalc::syntax
