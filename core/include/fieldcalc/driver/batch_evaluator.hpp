// fieldcalc/driver/batch_evaluator.hpp - Evaluate all calculated fields of an entity
//
// Pipeline per batch:
// parse every formula -> dependency graph -> evaluation order -> evaluate in
// order, feeding each computed value into the snapshot for later fields.
//
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/eval/evaluator.hpp"
#include "fieldcalc/eval/function_registry.hpp"
#include "fieldcalc/syntax/frontend.hpp"

namespace fieldcalc
{

/// Calculated field id -> formula text
using FormulaTextMap = std::map<std::string, std::string, std::less<>>;

/**
 * Parse every formula and compute a deterministic evaluation order.
 *
 * @return The order, the first syntax error (message prefixed with the field
 *         id, the id in `names`), or the CircularDependency error
 */
[[nodiscard]] Result<std::vector<std::string>> compute_evaluation_order(
  const FormulaTextMap & formulas);

// ============================================================================
// Options / Result
// ============================================================================

struct EvaluationOptions
{
  /// Per-field wall-clock budget. Exceeding it is reported, never interrupted.
  std::optional<std::chrono::milliseconds> field_budget;
};

struct BatchResult
{
  /// Evaluation order of the calculated fields
  std::vector<std::string> order;

  /// One result per calculated field
  std::map<std::string, Result<Value>, std::less<>> results;

  /// Input snapshot plus every successfully computed field
  FieldSnapshot snapshot;

  /// Fields whose evaluation took longer than EvaluationOptions::field_budget
  std::vector<std::string> over_budget;

  [[nodiscard]] size_t failure_count() const;
  [[nodiscard]] bool all_succeeded() const { return failure_count() == 0; }
};

// ============================================================================
// BatchEvaluator
// ============================================================================

/**
 * Evaluates one entity's calculated fields in dependency order.
 *
 * Syntax and cycle errors abort the batch. Evaluation errors are recorded per
 * field and the batch continues; a failed field is left out of the merged
 * snapshot, so fields reading it fail with UndefinedField.
 *
 * Parsed formulas are cached across calls on the same evaluator, up to the
 * cache capacity given at construction.
 */
class BatchEvaluator
{
public:
  explicit BatchEvaluator(
    const FunctionRegistry & registry,
    size_t cache_capacity = FormulaCache::k_default_capacity)
  : registry_(registry), cache_(cache_capacity)
  {
  }

  [[nodiscard]] Result<BatchResult> evaluate(
    const FormulaTextMap & formulas, const FieldSnapshot & snapshot,
    const EvaluationOptions & options = {});

  [[nodiscard]] FormulaCache & cache() noexcept { return cache_; }

private:
  const FunctionRegistry & registry_;
  FormulaCache cache_;
};

}  // namespace fieldcalc
