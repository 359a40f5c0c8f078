// fieldcalc/eval/evaluator.cpp - Formula evaluation implementation

#include "fieldcalc/eval/evaluator.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "fieldcalc/basic/casting.hpp"

namespace fieldcalc
{

namespace
{

constexpr int64_t k_int_min = std::numeric_limits<int64_t>::min();
constexpr int64_t k_int_max = std::numeric_limits<int64_t>::max();

bool add_overflows(int64_t a, int64_t b)
{
  return (b > 0 && a > k_int_max - b) || (b < 0 && a < k_int_min - b);
}

bool sub_overflows(int64_t a, int64_t b)
{
  return (b < 0 && a > k_int_max + b) || (b > 0 && a < k_int_min + b);
}

bool mul_overflows(int64_t a, int64_t b)
{
  if (a == 0 || b == 0) return false;
  if (a == -1) return b == k_int_min;
  if (b == -1) return a == k_int_min;
  if (a > 0) {
    return (b > 0) ? a > k_int_max / b : b < k_int_min / a;
  }
  return (b > 0) ? a < k_int_min / b : a < k_int_max / b;
}

/// Exponentiation by squaring; nullopt on overflow
std::optional<int64_t> checked_ipow(int64_t base, int64_t exp)
{
  int64_t result = 1;
  while (exp > 0) {
    if ((exp & 1) != 0) {
      if (mul_overflows(result, base)) return std::nullopt;
      result *= base;
    }
    exp >>= 1;
    if (exp > 0) {
      if (mul_overflows(base, base)) return std::nullopt;
      base *= base;
    }
  }
  return result;
}

FormulaError operand_mismatch(BinaryOp op, const Value & lhs, const Value & rhs, SourceRange range)
{
  return FormulaError::make(
    ErrorKind::TypeMismatch,
    fmt::format(
      "unsupported operand types for '{}': {} and {}", to_string(op), lhs.type_name(),
      rhs.type_name()),
    range);
}

Result<Value> float_arithmetic(BinaryOp op, double l, double r, SourceRange range)
{
  switch (op) {
    case BinaryOp::Add:
      return Value::make_float(l + r);
    case BinaryOp::Sub:
      return Value::make_float(l - r);
    case BinaryOp::Mul:
      return Value::make_float(l * r);
    case BinaryOp::Div:
      if (r == 0.0) {
        return FormulaError::make(ErrorKind::DivisionByZero, "division by zero", range);
      }
      return Value::make_float(l / r);
    case BinaryOp::Mod: {
      if (r == 0.0) {
        return FormulaError::make(ErrorKind::DivisionByZero, "modulo by zero", range);
      }
      // Floored: the result takes the sign of the divisor
      double m = std::fmod(l, r);
      if (m != 0.0 && ((m < 0.0) != (r < 0.0))) {
        m += r;
      }
      return Value::make_float(m);
    }
    case BinaryOp::Pow:
      if (l == 0.0 && r < 0.0) {
        return FormulaError::make(
          ErrorKind::DivisionByZero, "zero cannot be raised to a negative power", range);
      }
      if (l < 0.0 && std::isfinite(r) && std::trunc(r) != r) {
        return FormulaError::make(
          ErrorKind::TypeMismatch,
          fmt::format("{} ** {} has no real result", format_float(l), format_float(r)), range);
      }
      return Value::make_float(std::pow(l, r));
    default:
      break;
  }
  return FormulaError::make(
    ErrorKind::TypeMismatch, fmt::format("'{}' is not an arithmetic operator", to_string(op)),
    range);
}

}  // namespace

// ============================================================================
// Operator semantics
// ============================================================================

Result<Value> eval_arithmetic(BinaryOp op, const Value & lhs, const Value & rhs, SourceRange range)
{
  if (!lhs.is_numeric() || !rhs.is_numeric()) {
    return operand_mismatch(op, lhs, rhs, range);
  }

  if (lhs.is_integer() && rhs.is_integer()) {
    const int64_t l = lhs.as_integer();
    const int64_t r = rhs.as_integer();

    switch (op) {
      case BinaryOp::Add:
        if (!add_overflows(l, r)) return Value::make_integer(l + r);
        break;
      case BinaryOp::Sub:
        if (!sub_overflows(l, r)) return Value::make_integer(l - r);
        break;
      case BinaryOp::Mul:
        if (!mul_overflows(l, r)) return Value::make_integer(l * r);
        break;
      case BinaryOp::Mod: {
        if (r == 0) {
          return FormulaError::make(ErrorKind::DivisionByZero, "modulo by zero", range);
        }
        if (r == -1) return Value::make_integer(0);
        int64_t m = l % r;
        if (m != 0 && ((m < 0) != (r < 0))) {
          m += r;
        }
        return Value::make_integer(m);
      }
      case BinaryOp::Pow:
        if (l == 0 && r < 0) {
          return FormulaError::make(
            ErrorKind::DivisionByZero, "zero cannot be raised to a negative power", range);
        }
        if (r >= 0) {
          if (auto p = checked_ipow(l, r)) return Value::make_integer(*p);
        }
        break;
      default:
        // Div always produces a float
        break;
    }
  }

  return float_arithmetic(op, *lhs.to_float(), *rhs.to_float(), range);
}

std::optional<int> compare_values(const Value & lhs, const Value & rhs)
{
  if (lhs.is_integer() && rhs.is_integer()) {
    const int64_t l = lhs.as_integer();
    const int64_t r = rhs.as_integer();
    return (l < r) ? -1 : (l > r ? 1 : 0);
  }
  if (lhs.is_numeric() && rhs.is_numeric()) {
    const double l = *lhs.to_float();
    const double r = *rhs.to_float();
    if (std::isnan(l) || std::isnan(r)) return std::nullopt;
    return (l < r) ? -1 : (l > r ? 1 : 0);
  }
  if (lhs.is_text() && rhs.is_text()) {
    const int c = lhs.as_text().compare(rhs.as_text());
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

Result<Value> eval_comparison(BinaryOp op, const Value & lhs, const Value & rhs, SourceRange range)
{
  if (op == BinaryOp::Eq) return Value::make_bool(values_equal(lhs, rhs));
  if (op == BinaryOp::Ne) return Value::make_bool(!values_equal(lhs, rhs));

  const bool comparable = (lhs.is_numeric() && rhs.is_numeric()) || (lhs.is_text() && rhs.is_text());
  if (!comparable) {
    return FormulaError::make(
      ErrorKind::TypeMismatch,
      fmt::format(
        "cannot compare {} and {} with '{}'", lhs.type_name(), rhs.type_name(), to_string(op)),
      range);
  }

  // NaN orders as unequal to everything, like IEEE comparisons
  const std::optional<int> c = compare_values(lhs, rhs);
  if (!c) return Value::make_bool(false);

  switch (op) {
    case BinaryOp::Lt:
      return Value::make_bool(*c < 0);
    case BinaryOp::Le:
      return Value::make_bool(*c <= 0);
    case BinaryOp::Gt:
      return Value::make_bool(*c > 0);
    case BinaryOp::Ge:
      return Value::make_bool(*c >= 0);
    default:
      break;
  }
  return operand_mismatch(op, lhs, rhs, range);
}

// ============================================================================
// Evaluator
// ============================================================================

Result<Value> evaluate(
  const Expr * expr, const FieldSnapshot & snapshot, const FunctionRegistry & registry)
{
  return Evaluator(snapshot, registry).evaluate(expr);
}

Result<Value> Evaluator::evaluate(const Expr * expr)
{
  if (expr == nullptr) {
    return FormulaError::syntax("empty formula", {});
  }
  return eval_expr(expr);
}

Result<Value> Evaluator::eval_expr(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      return Value::make_integer(cast<IntLiteralExpr>(expr)->value);
    case NodeKind::FloatLiteral:
      return Value::make_float(cast<FloatLiteralExpr>(expr)->value);
    case NodeKind::StringLiteral:
      return Value::make_text(std::string(cast<StringLiteralExpr>(expr)->value));
    case NodeKind::BoolLiteral:
      return Value::make_bool(cast<BoolLiteralExpr>(expr)->value);
    case NodeKind::NullLiteral:
      return Value::make_null();
    case NodeKind::FieldRef:
      return eval_field_ref(cast<FieldRefExpr>(expr));
    case NodeKind::UnaryExpr:
      return eval_unary_expr(cast<UnaryExpr>(expr));
    case NodeKind::BinaryExpr:
      return eval_binary_expr(cast<BinaryExpr>(expr));
    case NodeKind::CallExpr:
      return eval_call_expr(cast<CallExpr>(expr));
  }
  return FormulaError::syntax("unsupported expression", expr->get_range());
}

Result<Value> Evaluator::eval_field_ref(const FieldRefExpr * node)
{
  auto it = snapshot_.find(node->name);
  if (it == snapshot_.end()) {
    return FormulaError::undefined_field(node->name, node->get_range());
  }
  return it->second;
}

Result<Value> Evaluator::eval_unary_expr(const UnaryExpr * node)
{
  auto operand = eval_expr(node->operand);
  if (!operand) return operand;
  const Value & v = operand.value();

  switch (node->op) {
    case UnaryOp::Not:
      return Value::make_bool(!is_truthy(v));

    case UnaryOp::Plus:
      if (v.is_numeric()) return operand;
      break;

    case UnaryOp::Neg:
      if (v.is_integer()) {
        if (v.as_integer() == k_int_min) {
          return Value::make_float(-static_cast<double>(v.as_integer()));
        }
        return Value::make_integer(-v.as_integer());
      }
      if (v.is_float()) {
        return Value::make_float(-v.as_float());
      }
      break;
  }

  return FormulaError::make(
    ErrorKind::TypeMismatch,
    fmt::format("bad operand type for unary '{}': {}", to_string(node->op), v.type_name()),
    node->get_range());
}

Result<Value> Evaluator::eval_binary_expr(const BinaryExpr * node)
{
  const BinaryOp op = node->op;

  if (is_logical(op)) {
    return eval_logical(node);
  }

  auto lhs = eval_expr(node->lhs);
  if (!lhs) return lhs;
  auto rhs = eval_expr(node->rhs);
  if (!rhs) return rhs;

  if (is_comparison(op)) {
    return eval_comparison(op, lhs.value(), rhs.value(), node->get_range());
  }
  return eval_arithmetic(op, lhs.value(), rhs.value(), node->get_range());
}

Result<Value> Evaluator::eval_logical(const BinaryExpr * node)
{
  auto lhs = eval_expr(node->lhs);
  if (!lhs) return lhs;

  const bool truthy = is_truthy(lhs.value());
  // `a or b` is decided by a truthy a, `a and b` by a falsy a
  if ((node->op == BinaryOp::Or) == truthy) {
    return lhs;
  }
  return eval_expr(node->rhs);
}

Result<Value> Evaluator::eval_call_expr(const CallExpr * node)
{
  std::vector<Value> args;
  args.reserve(node->args.size());
  for (const auto * arg : node->args) {
    auto v = eval_expr(arg);
    if (!v) return v;
    args.push_back(std::move(v).value());
  }

  return registry_.call(
    node->callee, gsl::span<const Value>(args.data(), args.size()), node->get_range());
}

}  // namespace fieldcalc
