// fieldcalc/driver/output_mappings.hpp - Render a field through its output mappings
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/coercion.hpp"
#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/eval/function_registry.hpp"
#include "fieldcalc/syntax/frontend.hpp"

namespace fieldcalc
{

/// One candidate way of producing a field's external value
struct OutputMapping
{
  std::string formula;
  OutputTarget target = OutputTarget::Text;
};

/**
 * Try each mapping in declared order: parse, evaluate, coerce.
 *
 * The first mapping that succeeds end to end wins. If there are no mappings,
 * or all of them fail, the result is a MappingFailed error; in the latter
 * case `causes` holds every attempt's error, prefixed with its target.
 *
 * @param cache Optional parse cache shared across calls
 */
[[nodiscard]] Result<Value> evaluate_output_mappings(
  std::string_view field_id, const std::vector<OutputMapping> & mappings,
  const FieldSnapshot & snapshot, const FunctionRegistry & registry,
  FormulaCache * cache = nullptr);

}  // namespace fieldcalc
