#include "fieldcalc/eval/value.hpp"

#include <fmt/core.h>

#include <ostream>
#include <string>

namespace fieldcalc
{

std::string_view Value::type_name() const noexcept
{
  switch (kind_) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Integer:
    case ValueKind::Float:
      return "number";
    case ValueKind::Bool:
      return "boolean";
    case ValueKind::Text:
      return "text";
  }
  return "";
}

bool is_truthy(const Value & v) noexcept
{
  switch (v.kind()) {
    case ValueKind::Null:
      return false;
    case ValueKind::Integer:
      return v.as_integer() != 0;
    case ValueKind::Float:
      return v.as_float() != 0.0;
    case ValueKind::Bool:
      return v.as_bool();
    case ValueKind::Text:
      return !v.as_text().empty();
  }
  return false;
}

bool values_equal(const Value & a, const Value & b) noexcept
{
  if (a.is_numeric() && b.is_numeric()) {
    if (a.is_integer() && b.is_integer()) {
      return a.as_integer() == b.as_integer();
    }
    return *a.to_float() == *b.to_float();
  }
  if (a.kind() != b.kind()) {
    return false;
  }

  switch (a.kind()) {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Text:
      return a.as_text() == b.as_text();
    default:
      return false;
  }
}

std::string format_float(double d)
{
  std::string s = fmt::format("{}", d);
  if (s.find_first_of(".en") == std::string::npos) {
    s += ".0";
  }
  return s;
}

std::string format_value(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Null:
      return {};
    case ValueKind::Integer:
      return fmt::format("{}", v.as_integer());
    case ValueKind::Float:
      return format_float(v.as_float());
    case ValueKind::Bool:
      return v.as_bool() ? "true" : "false";
    case ValueKind::Text:
      return v.as_text();
  }
  return {};
}

bool operator==(const Value & a, const Value & b) noexcept
{
  if (a.kind() != b.kind()) {
    return false;
  }

  switch (a.kind()) {
    case ValueKind::Null:
      return true;
    case ValueKind::Integer:
      return a.as_integer() == b.as_integer();
    case ValueKind::Float:
      return a.as_float() == b.as_float();
    case ValueKind::Bool:
      return a.as_bool() == b.as_bool();
    case ValueKind::Text:
      return a.as_text() == b.as_text();
  }
  return false;
}

std::ostream & operator<<(std::ostream & os, const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Null:
      return os << "null";
    case ValueKind::Text:
      return os << "text \"" << v.as_text() << '"';
    default:
      return os << to_string(v.kind()) << ' ' << format_value(v);
  }
}

}  // namespace fieldcalc
