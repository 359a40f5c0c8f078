// fieldcalc/basic/error.hpp - Error kinds and the Result<T> type
//
// Every fallible operation in the formula core returns Result<T>, holding
// either a value or a FormulaError describing exactly one failure kind.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "fieldcalc/basic/source_manager.hpp"

namespace fieldcalc
{

// ============================================================================
// ErrorKind
// ============================================================================

enum class ErrorKind : uint8_t {
  Syntax,              ///< Tokenizer/parser failure
  UndefinedField,      ///< Field reference missing from the snapshot
  TypeMismatch,        ///< Operator applied to unsupported operand kinds
  DivisionByZero,      ///< '/' or '%' by zero, or 0 raised to a negative power
  UnknownFunction,     ///< Call to a name missing from the function registry
  FunctionArgument,    ///< A function rejected its arguments
  CircularDependency,  ///< Calculated fields reference each other in a cycle
  Coercion,            ///< Value cannot be converted to an output target
  MappingFailed,       ///< No output mapping produced a value
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::Syntax:
      return "syntax error";
    case ErrorKind::UndefinedField:
      return "undefined field";
    case ErrorKind::TypeMismatch:
      return "type mismatch";
    case ErrorKind::DivisionByZero:
      return "division by zero";
    case ErrorKind::UnknownFunction:
      return "unknown function";
    case ErrorKind::FunctionArgument:
      return "invalid function argument";
    case ErrorKind::CircularDependency:
      return "circular dependency";
    case ErrorKind::Coercion:
      return "coercion error";
    case ErrorKind::MappingFailed:
      return "output mapping failed";
  }
  return "";
}

/// Stable diagnostic code for an error kind ("F0001"...).
[[nodiscard]] constexpr std::string_view error_code(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::Syntax:
      return "F0001";
    case ErrorKind::UndefinedField:
      return "F0002";
    case ErrorKind::TypeMismatch:
      return "F0003";
    case ErrorKind::DivisionByZero:
      return "F0004";
    case ErrorKind::UnknownFunction:
      return "F0005";
    case ErrorKind::FunctionArgument:
      return "F0006";
    case ErrorKind::CircularDependency:
      return "F0007";
    case ErrorKind::Coercion:
      return "F0008";
    case ErrorKind::MappingFailed:
      return "F0009";
  }
  return "";
}

// ============================================================================
// FormulaError
// ============================================================================

struct FormulaError
{
  ErrorKind kind = ErrorKind::Syntax;
  std::string message;

  /// Byte range in the formula text, invalid when the error has no position
  SourceRange range;

  /// Field or function names the error is about
  std::vector<std::string> names;

  /// Per-attempt failures of an aggregated error
  std::vector<FormulaError> causes;

  /// Optional suggestion shown as "help:" in diagnostics
  std::string help;

  static FormulaError make(ErrorKind kind, std::string message, SourceRange range = {})
  {
    FormulaError e;
    e.kind = kind;
    e.message = std::move(message);
    e.range = range;
    return e;
  }

  static FormulaError syntax(std::string message, SourceRange range)
  {
    return make(ErrorKind::Syntax, std::move(message), range);
  }

  static FormulaError undefined_field(std::string_view name, SourceRange range = {});
  static FormulaError unknown_function(std::string_view name, SourceRange range = {});

  [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

  /// "<kind>: <message>", used by tools and test failure output
  [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Result<T>
// ============================================================================

/**
 * Result type using std::variant.
 * Holds either a success value T or a FormulaError.
 */
template <typename T>
class Result
{
public:
  using ValueType = T;
  using ErrorType = FormulaError;

  // Construct with success value
  Result(T value) : data_(std::move(value)) {}

  // Construct with error
  Result(FormulaError error) : data_(std::move(error)) {}

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<ErrorType>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }
  ErrorType && error() && { return std::get<ErrorType>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

}  // namespace fieldcalc
