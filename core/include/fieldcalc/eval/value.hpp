// fieldcalc/eval/value.hpp - Runtime value of a formula or field
//
// Integer and Float are the two representations of the Number type of the
// formula language. Text owns its characters so values can outlive the
// formula that produced them.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace fieldcalc
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Null,     ///< null literal or missing result
  Integer,  ///< 64-bit signed integer
  Float,    ///< 64-bit floating point
  Bool,     ///< Boolean
  Text,     ///< UTF-8 text
};

[[nodiscard]] constexpr std::string_view to_string(ValueKind k) noexcept
{
  switch (k) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::Bool:
      return "boolean";
    case ValueKind::Text:
      return "text";
  }
  return "";
}

/// Static result type of an expression (used by checking and functions)
enum class ResultType : uint8_t {
  Unknown,
  Number,
  Text,
  Boolean,
};

[[nodiscard]] constexpr std::string_view to_string(ResultType t) noexcept
{
  switch (t) {
    case ResultType::Unknown:
      return "unknown";
    case ResultType::Number:
      return "number";
    case ResultType::Text:
      return "text";
    case ResultType::Boolean:
      return "boolean";
  }
  return "";
}

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_null() { return Value(); }

  static Value make_integer(int64_t value)
  {
    Value v;
    v.kind_ = ValueKind::Integer;
    v.intValue_ = value;
    return v;
  }

  static Value make_float(double value)
  {
    Value v;
    v.kind_ = ValueKind::Float;
    v.floatValue_ = value;
    return v;
  }

  static Value make_bool(bool value)
  {
    Value v;
    v.kind_ = ValueKind::Bool;
    v.boolValue_ = value;
    return v;
  }

  static Value make_text(std::string value)
  {
    Value v;
    v.kind_ = ValueKind::Text;
    v.textValue_ = std::move(value);
    return v;
  }

  /// Default constructor creates a Null value
  Value() = default;

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
  [[nodiscard]] bool is_text() const noexcept { return kind_ == ValueKind::Text; }

  /// Integer or Float. Booleans are never numeric.
  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }

  // ===========================================================================
  // Value Accessors
  // ===========================================================================

  /// Get integer value (only valid if is_integer())
  [[nodiscard]] int64_t as_integer() const noexcept { return intValue_; }

  /// Get float value (only valid if is_float())
  [[nodiscard]] double as_float() const noexcept { return floatValue_; }

  /// Get boolean value (only valid if is_bool())
  [[nodiscard]] bool as_bool() const noexcept { return boolValue_; }

  /// Get text value (only valid if is_text())
  [[nodiscard]] const std::string & as_text() const noexcept { return textValue_; }

  /// Numeric value widened to double
  [[nodiscard]] std::optional<double> to_float() const
  {
    if (is_float()) return floatValue_;
    if (is_integer()) return static_cast<double>(intValue_);
    return std::nullopt;
  }

  /// Semantic type name used in messages: "number", "text", "boolean", "null"
  [[nodiscard]] std::string_view type_name() const noexcept;

private:
  ValueKind kind_ = ValueKind::Null;
  int64_t intValue_ = 0;
  double floatValue_ = 0.0;
  bool boolValue_ = false;
  std::string textValue_;
};

// ============================================================================
// Language rules shared by the evaluator, functions and coercion
// ============================================================================

/// null, false, numeric zero and empty text are falsy; everything else is truthy.
[[nodiscard]] bool is_truthy(const Value & v) noexcept;

/**
 * Equality as seen by the `==` operator.
 *
 * Integer and Float compare by numeric value. Values of different semantic
 * types are never equal; this never fails.
 */
[[nodiscard]] bool values_equal(const Value & a, const Value & b) noexcept;

/// Textual representation (TEXT coercion, concat, CLI output). Null is "".
[[nodiscard]] std::string format_value(const Value & v);

/// Shortest round-trip form of a double, with ".0" appended when integral.
[[nodiscard]] std::string format_float(double d);

/// Structural equality: same kind and same payload (used by tests).
[[nodiscard]] bool operator==(const Value & a, const Value & b) noexcept;
[[nodiscard]] inline bool operator!=(const Value & a, const Value & b) noexcept
{
  return !(a == b);
}

/// Debug form: `integer 5`, `text "abc"`, `null`
std::ostream & operator<<(std::ostream & os, const Value & v);

}  // namespace fieldcalc
