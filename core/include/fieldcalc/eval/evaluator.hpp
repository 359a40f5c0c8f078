// fieldcalc/eval/evaluator.hpp - Tree-walking formula interpreter
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/ast_enums.hpp"
#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/function_registry.hpp"
#include "fieldcalc/eval/value.hpp"

namespace fieldcalc
{

/// Field id -> current value. A missing key is an undefined field, not null.
using FieldSnapshot = std::map<std::string, Value, std::less<>>;

/**
 * Evaluates one formula tree against a read-only snapshot.
 *
 * ## Semantics
 * - Field references look the name up in the snapshot (UndefinedField if absent)
 * - `and` / `or` short-circuit and yield the operand that decided the result
 * - `==` / `!=` never fail; ordering comparisons need number/number or text/text
 * - Arithmetic needs numbers; `/` always yields a float
 * - Calls evaluate all arguments left to right, then dispatch via the registry
 *
 * The first failing sub-expression aborts the whole evaluation.
 *
 * ## Usage
 * ```cpp
 * auto registry = FunctionRegistry::with_builtins();
 * Evaluator eval(snapshot, registry);
 * Result<Value> v = eval.evaluate(formula.root());
 * ```
 */
class Evaluator
{
public:
  Evaluator(const FieldSnapshot & snapshot, const FunctionRegistry & registry)
  : snapshot_(snapshot), registry_(registry)
  {
  }

  [[nodiscard]] Result<Value> evaluate(const Expr * expr);

private:
  Result<Value> eval_expr(const Expr * expr);
  Result<Value> eval_field_ref(const FieldRefExpr * node);
  Result<Value> eval_unary_expr(const UnaryExpr * node);
  Result<Value> eval_binary_expr(const BinaryExpr * node);
  Result<Value> eval_logical(const BinaryExpr * node);
  Result<Value> eval_call_expr(const CallExpr * node);

  const FieldSnapshot & snapshot_;
  const FunctionRegistry & registry_;
};

/// Convenience wrapper around Evaluator
[[nodiscard]] Result<Value> evaluate(
  const Expr * expr, const FieldSnapshot & snapshot, const FunctionRegistry & registry);

// ============================================================================
// Operator semantics (shared with built-in functions)
// ============================================================================

/**
 * Apply `+ - * / % **` to two values.
 *
 * Integer operands stay integral except for `/` and negative exponents;
 * an overflowing integer result is recomputed as a float.
 */
[[nodiscard]] Result<Value> eval_arithmetic(
  BinaryOp op, const Value & lhs, const Value & rhs, SourceRange range = {});

/// Apply `== != < <= > >=` to two values.
[[nodiscard]] Result<Value> eval_comparison(
  BinaryOp op, const Value & lhs, const Value & rhs, SourceRange range = {});

/// Three-way compare of two numbers or two texts (-1, 0, 1); nullopt otherwise.
[[nodiscard]] std::optional<int> compare_values(const Value & lhs, const Value & rhs);

}  // namespace fieldcalc
