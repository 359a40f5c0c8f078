// fieldcalc/eval/coercion.hpp - Conversion of results to output representations
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/value.hpp"

namespace fieldcalc
{

enum class OutputTarget : uint8_t {
  Text,
  Number,
  Boolean,
};

[[nodiscard]] constexpr std::string_view to_string(OutputTarget t) noexcept
{
  switch (t) {
    case OutputTarget::Text:
      return "TEXT";
    case OutputTarget::Number:
      return "NUMBER";
    case OutputTarget::Boolean:
      return "BOOLEAN";
  }
  return "";
}

/// Case-insensitive: "text", "NUMBER", "Boolean"...
[[nodiscard]] std::optional<OutputTarget> parse_output_target(std::string_view name);

/**
 * Convert a value to an output target.
 *
 * - TEXT: textual representation, null becomes ""; never fails
 * - NUMBER: numbers only (as a float); booleans, text and null are rejected
 * - BOOLEAN: truthiness; never fails
 */
[[nodiscard]] Result<Value> coerce(const Value & value, OutputTarget target);

}  // namespace fieldcalc
