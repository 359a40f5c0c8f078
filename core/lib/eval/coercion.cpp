#include "fieldcalc/eval/coercion.hpp"

#include <fmt/core.h>

#include <cctype>

namespace fieldcalc
{

std::optional<OutputTarget> parse_output_target(std::string_view name)
{
  for (const auto t : {OutputTarget::Text, OutputTarget::Number, OutputTarget::Boolean}) {
    const std::string_view canon = to_string(t);
    if (canon.size() != name.size()) continue;

    bool same = true;
    for (size_t i = 0; i < name.size() && same; ++i) {
      same = std::toupper(static_cast<unsigned char>(name[i])) == canon[i];
    }
    if (same) return t;
  }
  return std::nullopt;
}

Result<Value> coerce(const Value & value, OutputTarget target)
{
  switch (target) {
    case OutputTarget::Text:
      return Value::make_text(format_value(value));

    case OutputTarget::Boolean:
      return Value::make_bool(is_truthy(value));

    case OutputTarget::Number:
      if (value.is_numeric()) {
        return Value::make_float(*value.to_float());
      }
      return FormulaError::make(
        ErrorKind::Coercion,
        fmt::format("cannot coerce {} to {}", value.type_name(), to_string(target)));
  }
  return FormulaError::make(ErrorKind::Coercion, "unknown output target");
}

}  // namespace fieldcalc
