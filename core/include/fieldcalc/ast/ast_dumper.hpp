// fieldcalc/ast/ast_dumper.hpp - Compact S-expression output of formula trees
//
// Used by tests for structural comparison and by `fcalc parse`.
//
#pragma once

#include <ostream>
#include <string>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/visitor.hpp"

namespace fieldcalc
{

// ============================================================================
// SexprPrinter
// ============================================================================

/**
 * Prints an expression as a parenthesized prefix form.
 *
 * @code
 *   1 + 2 * 3          =>  (+ 1 (* 2 3))
 *   -x ** 2            =>  (** (- x) 2)
 *   max(a, "b")        =>  (max a "b")
 *   not a or b         =>  (or (not a) b)
 * @endcode
 *
 * Float literals always carry a fraction or exponent (`2.0`), strings are
 * re-quoted with escapes, and a call with no arguments prints as `(now)`.
 */
class SexprPrinter : public ConstAstVisitor<SexprPrinter>
{
public:
  explicit SexprPrinter(std::ostream & os) : os_(os) {}

  void visit_int_literal_expr(const IntLiteralExpr * node);
  void visit_float_literal_expr(const FloatLiteralExpr * node);
  void visit_string_literal_expr(const StringLiteralExpr * node);
  void visit_bool_literal_expr(const BoolLiteralExpr * node);
  void visit_null_literal_expr(const NullLiteralExpr * node);
  void visit_field_ref_expr(const FieldRefExpr * node);
  void visit_unary_expr(const UnaryExpr * node);
  void visit_binary_expr(const BinaryExpr * node);
  void visit_call_expr(const CallExpr * node);

private:
  std::ostream & os_;
};

/// Dump an expression to an S-expression string.
[[nodiscard]] std::string dump_sexpr(const Expr * expr);

}  // namespace fieldcalc
