#include "fieldcalc/syntax/parser.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

namespace fieldcalc::syntax
{
namespace
{

std::optional<BinaryOp> comparison_op(TokenKind k)
{
  switch (k) {
    case TokenKind::EqEq:
      return BinaryOp::Eq;
    case TokenKind::Ne:
      return BinaryOp::Ne;
    case TokenKind::Lt:
      return BinaryOp::Lt;
    case TokenKind::Le:
      return BinaryOp::Le;
    case TokenKind::Gt:
      return BinaryOp::Gt;
    case TokenKind::Ge:
      return BinaryOp::Ge;
    default:
      return std::nullopt;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view msg)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), fmt::format("{}, found {}", msg, describe(cur())));
  return false;
}

void Parser::error_at(const Token & t, std::string msg)
{
  if (!error_) {
    error_ = FormulaError::syntax(std::move(msg), t.range);
  }
}

std::string Parser::describe(const Token & t)
{
  if (t.kind == TokenKind::Eof) {
    return "end of formula";
  }
  if (t.kind == TokenKind::StringLiteral) {
    return fmt::format("string \"{}\"", t.text);
  }
  return fmt::format("'{}'", t.text);
}

bool Parser::nesting_exceeded()
{
  if (depth_ <= k_max_nesting_depth) {
    return false;
  }
  error_at(cur(), fmt::format("expression nested too deeply (limit {})", k_max_nesting_depth));
  return true;
}

bool Parser::operator_limit_exceeded(const Token & op)
{
  if (++operators_ <= k_max_operators) {
    return false;
  }
  error_at(op, fmt::format("formula has too many operators (limit {})", k_max_operators));
  return true;
}

// ============================================================================
// Entry point
// ============================================================================

Result<const Expr *> Parser::parse()
{
  if (tokens_.empty() || tokens_.front().kind == TokenKind::Eof) {
    const SourceRange at = tokens_.empty() ? SourceRange(0, 0) : tokens_.front().range;
    return FormulaError::syntax("empty formula", at);
  }

  Expr * root = parse_expr();
  if (root != nullptr && !at_eof()) {
    error_at(cur(), fmt::format("unexpected token {}", describe(cur())));
  }
  if (error_) {
    return *std::move(error_);
  }
  return static_cast<const Expr *>(root);
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr()
{
  const DepthScope scope(depth_);
  if (nesting_exceeded()) return nullptr;
  return parse_or();
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (lhs != nullptr && at(TokenKind::KwOr)) {
    const Token op_tok = advance();
    if (operator_limit_exceeded(op_tok)) return nullptr;
    Expr * rhs = parse_and();
    if (rhs == nullptr) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()), op_tok.range);
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_not();
  while (lhs != nullptr && at(TokenKind::KwAnd)) {
    const Token op_tok = advance();
    if (operator_limit_exceeded(op_tok)) return nullptr;
    Expr * rhs = parse_not();
    if (rhs == nullptr) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()), op_tok.range);
  }
  return lhs;
}

Expr * Parser::parse_not()
{
  if (match(TokenKind::KwNot)) {
    const Token op = tokens_[idx_ - 1];
    const DepthScope scope(depth_);
    if (nesting_exceeded()) return nullptr;
    Expr * e = parse_not();
    if (e == nullptr) return nullptr;
    return ast_.create<UnaryExpr>(UnaryOp::Not, e, join_ranges(op.range, e->get_range()));
  }
  return parse_comparison();
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();
  while (lhs != nullptr) {
    const std::optional<BinaryOp> op = comparison_op(cur().kind);
    if (!op) break;
    const Token op_tok = advance();
    if (operator_limit_exceeded(op_tok)) return nullptr;
    Expr * rhs = parse_add();
    if (rhs == nullptr) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, *op, rhs, join_ranges(lhs->get_range(), rhs->get_range()), op_tok.range);
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (lhs != nullptr && (at(TokenKind::Plus) || at(TokenKind::Minus))) {
    const Token op_tok = advance();
    if (operator_limit_exceeded(op_tok)) return nullptr;
    const BinaryOp op = (op_tok.kind == TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    if (rhs == nullptr) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()), op_tok.range);
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_power();
  while (lhs != nullptr &&
         (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent))) {
    const Token op_tok = advance();
    if (operator_limit_exceeded(op_tok)) return nullptr;
    BinaryOp op = BinaryOp::Mul;
    if (op_tok.kind == TokenKind::Slash) {
      op = BinaryOp::Div;
    } else if (op_tok.kind == TokenKind::Percent) {
      op = BinaryOp::Mod;
    }
    Expr * rhs = parse_power();
    if (rhs == nullptr) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()), op_tok.range);
  }
  return lhs;
}

Expr * Parser::parse_power()
{
  Expr * base = parse_unary();
  if (base == nullptr || !at(TokenKind::StarStar)) {
    return base;
  }
  const Token op_tok = advance();
  if (operator_limit_exceeded(op_tok)) return nullptr;
  // Right-associative: the exponent is itself a power expression
  const DepthScope scope(depth_);
  if (nesting_exceeded()) return nullptr;
  Expr * exponent = parse_power();
  if (exponent == nullptr) return nullptr;
  return ast_.create<BinaryExpr>(
    base, BinaryOp::Pow, exponent, join_ranges(base->get_range(), exponent->get_range()),
    op_tok.range);
}

Expr * Parser::parse_unary()
{
  if (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const Token op = advance();
    const DepthScope scope(depth_);
    if (nesting_exceeded()) return nullptr;
    Expr * e = parse_unary();
    if (e == nullptr) return nullptr;
    const UnaryOp uop = (op.kind == TokenKind::Plus) ? UnaryOp::Plus : UnaryOp::Neg;
    return ast_.create<UnaryExpr>(uop, e, join_ranges(op.range, e->get_range()));
  }
  return parse_primary();
}

Expr * Parser::parse_primary()
{
  const Token t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
      advance();
      return parse_number(t);
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape_string(t.text)), t.range);
    case TokenKind::KwTrue:
      advance();
      return ast_.create<BoolLiteralExpr>(true, t.range);
    case TokenKind::KwFalse:
      advance();
      return ast_.create<BoolLiteralExpr>(false, t.range);
    case TokenKind::KwNull:
      advance();
      return ast_.create<NullLiteralExpr>(t.range);
    case TokenKind::Identifier:
      advance();
      if (at(TokenKind::LParen)) {
        return parse_call(t);
      }
      return ast_.create<FieldRefExpr>(ast_.intern(t.text), t.range);
    case TokenKind::LParen: {
      advance();
      Expr * e = parse_expr();
      if (e == nullptr) return nullptr;
      if (!expect(TokenKind::RParen, "expected ')' after expression")) return nullptr;
      return e;
    }
    default:
      break;
  }

  if (t.kind == TokenKind::Eof) {
    error_at(t, "unexpected end of formula, expected expression");
  } else {
    error_at(t, fmt::format("unexpected token {}, expected expression", describe(t)));
  }
  return nullptr;
}

Expr * Parser::parse_call(const Token & name_tok)
{
  advance();  // '('

  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    while (true) {
      Expr * arg = parse_expr();
      if (arg == nullptr) return nullptr;
      args.push_back(arg);

      if (match(TokenKind::Comma)) {
        continue;
      }
      if (at(TokenKind::RParen)) {
        break;
      }
      error_at(
        cur(), fmt::format("expected ',' or ')' in function call, found {}", describe(cur())));
      return nullptr;
    }
  }

  const Token rp = advance();  // ')'
  return ast_.create<CallExpr>(
    ast_.intern(name_tok.text), name_tok.range, ast_.copy_to_arena(args),
    join_ranges(name_tok.range, rp.range));
}

Expr * Parser::parse_number(const Token & t)
{
  if (t.kind == TokenKind::IntLiteral) {
    int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(t.text.data(), t.text.data() + t.text.size(), v);
    (void)ptr;
    if (ec == std::errc()) {
      return ast_.create<IntLiteralExpr>(v, t.range);
    }
    // Out of int64 range: fall through and read as a float
  }

  const std::string tmp(t.text);
  const double v = std::strtod(tmp.c_str(), nullptr);
  return ast_.create<FloatLiteralExpr>(v, t.range);
}

std::string Parser::unescape_string(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }

    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      default:
        // \\ \" \' and unknown escapes all yield the escaped character
        out.push_back(esc);
        break;
    }
  }

  return out;
}

}  // namespace fieldcalc::syntax
