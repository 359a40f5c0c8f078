// fieldcalc/sema/analysis/formula_checker.hpp - Static checks on parsed formulas
//
// Runs without field values: reports problems that would make every
// evaluation fail, plus suspicious operand types.
//
#pragma once

#include <functional>
#include <map>
#include <string>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/basic/diagnostic.hpp"
#include "fieldcalc/eval/function_registry.hpp"
#include "fieldcalc/eval/value.hpp"
#include "fieldcalc/syntax/frontend.hpp"

namespace fieldcalc
{

/// Field id -> declared type of every field visible to a formula
using FieldSchema = std::map<std::string, ResultType, std::less<>>;

/**
 * Static checker for formulas of one entity.
 *
 * ## Reported problems
 * - error: reference to a field missing from the schema
 * - error: call to a function that is not registered
 * - error: call with an argument count the function does not accept
 * - warning: arithmetic or unary +/- on an operand inferred as text
 */
class FormulaChecker
{
public:
  FormulaChecker(const FunctionRegistry & registry, const FieldSchema & schema)
  : registry_(registry), schema_(schema)
  {
  }

  /**
   * Check one formula.
   *
   * @return true if no errors were reported (warnings do not count)
   */
  bool check(const Formula & formula, DiagnosticBag & diags) const;
  bool check(const Expr * root, DiagnosticBag & diags) const;

  /// Result type of an expression, Unknown when it depends on runtime values
  [[nodiscard]] ResultType infer_type(const Expr * expr) const;

private:
  const FunctionRegistry & registry_;
  const FieldSchema & schema_;
};

}  // namespace fieldcalc
