// fieldcalc/test_support/parse_helpers.hpp - helpers for unit tests
//
// Thin wrappers over the parse/evaluate pipeline so tests can go from formula
// text to an S-expression, a value or an error in one call.
//
#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "fieldcalc/ast/ast_dumper.hpp"
#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/eval/function_registry.hpp"
#include "fieldcalc/syntax/frontend.hpp"

namespace fieldcalc::test_support
{

/// 2024-03-05T14:07:09Z
inline Clock fixed_clock()
{
  return [] { return std::chrono::system_clock::time_point(std::chrono::seconds(1709647629)); };
}

/// Built-in registry with a fixed clock
[[nodiscard]] inline const FunctionRegistry & builtins()
{
  static const FunctionRegistry registry = FunctionRegistry::with_builtins(fixed_clock());
  return registry;
}

/// S-expression of the parsed formula, or "error: <message>"
[[nodiscard]] inline std::string sexpr(std::string src)
{
  auto f = parse_formula(std::move(src));
  if (!f) return "error: " + f.error().message;
  return dump_sexpr(f->root());
}

/// Error of a formula that is expected not to parse
[[nodiscard]] inline FormulaError parse_error(std::string src)
{
  auto f = parse_formula(std::move(src));
  if (f) return FormulaError::make(ErrorKind::Syntax, "<parsed successfully>");
  return std::move(f).error();
}

/// Parse and evaluate with the built-in functions
[[nodiscard]] inline Result<Value> eval(std::string src, const FieldSnapshot & snapshot = {})
{
  auto f = parse_formula(std::move(src));
  if (!f) return std::move(f).error();
  return evaluate(f->root(), snapshot, builtins());
}

}  // namespace fieldcalc::test_support
