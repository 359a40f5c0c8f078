#include "fieldcalc/driver/output_mappings.hpp"

#include <fmt/core.h>

#include <memory>
#include <utility>

namespace fieldcalc
{

namespace
{

Result<Value> attempt(
  const OutputMapping & mapping, const FieldSnapshot & snapshot,
  const FunctionRegistry & registry, FormulaCache & cache)
{
  auto formula = cache.get(mapping.formula);
  if (!formula) {
    return std::move(formula).error();
  }

  auto value = evaluate(formula.value()->root(), snapshot, registry);
  if (!value) {
    return value;
  }
  return coerce(value.value(), mapping.target);
}

}  // namespace

Result<Value> evaluate_output_mappings(
  std::string_view field_id, const std::vector<OutputMapping> & mappings,
  const FieldSnapshot & snapshot, const FunctionRegistry & registry, FormulaCache * cache)
{
  if (mappings.empty()) {
    auto err = FormulaError::make(
      ErrorKind::MappingFailed, fmt::format("no output mapping defined for field '{}'", field_id));
    err.names.emplace_back(field_id);
    return err;
  }

  FormulaCache local_cache;
  FormulaCache & parse_cache = (cache != nullptr) ? *cache : local_cache;

  std::vector<FormulaError> failures;
  for (const auto & mapping : mappings) {
    auto result = attempt(mapping, snapshot, registry, parse_cache);
    if (result) {
      return result;
    }

    FormulaError cause = std::move(result).error();
    cause.message = fmt::format("{}: {}", to_string(mapping.target), cause.message);
    failures.push_back(std::move(cause));
  }

  auto err = FormulaError::make(
    ErrorKind::MappingFailed, fmt::format("all output mappings failed for field '{}'", field_id));
  err.names.emplace_back(field_id);
  err.causes = std::move(failures);
  return err;
}

}  // namespace fieldcalc
