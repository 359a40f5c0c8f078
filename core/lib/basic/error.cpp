// fieldcalc/basic/error.cpp - FormulaError helpers
#include "fieldcalc/basic/error.hpp"

#include <fmt/core.h>

namespace fieldcalc
{

FormulaError FormulaError::undefined_field(std::string_view name, SourceRange range)
{
  FormulaError e = make(ErrorKind::UndefinedField, fmt::format("undefined field '{}'", name), range);
  e.names.emplace_back(name);
  return e;
}

FormulaError FormulaError::unknown_function(std::string_view name, SourceRange range)
{
  FormulaError e =
    make(ErrorKind::UnknownFunction, fmt::format("unknown function '{}'", name), range);
  e.names.emplace_back(name);
  return e;
}

std::string FormulaError::to_string() const
{
  return fmt::format("{}: {}", fieldcalc::to_string(kind), message);
}

}  // namespace fieldcalc
