#include "fieldcalc/driver/batch_evaluator.hpp"

#include <fmt/core.h>

#include <memory>
#include <utility>

#include "fieldcalc/sema/analysis/dependency_graph.hpp"

namespace fieldcalc
{

namespace
{

FormulaError for_field(std::string_view field_id, FormulaError err)
{
  err.message = fmt::format("field '{}': {}", field_id, err.message);
  err.names.insert(err.names.begin(), std::string(field_id));
  return err;
}

using ParsedMap = std::map<std::string, std::shared_ptr<const Formula>, std::less<>>;

/// Parse all formulas; the first failure (in field id order) wins
Result<ParsedMap> parse_all(const FormulaTextMap & formulas, FormulaCache & cache)
{
  ParsedMap parsed;
  for (const auto & [id, text] : formulas) {
    auto f = cache.get(text);
    if (!f) {
      return for_field(id, std::move(f).error());
    }
    parsed.emplace(id, std::move(f).value());
  }
  return parsed;
}

FieldAstMap roots_of(const ParsedMap & parsed)
{
  FieldAstMap roots;
  for (const auto & [id, formula] : parsed) {
    roots.emplace(id, formula->root());
  }
  return roots;
}

}  // namespace

Result<std::vector<std::string>> compute_evaluation_order(const FormulaTextMap & formulas)
{
  FormulaCache cache;
  auto parsed = parse_all(formulas, cache);
  if (!parsed) {
    return std::move(parsed).error();
  }
  return DependencyGraph::build(roots_of(parsed.value())).topological_order();
}

size_t BatchResult::failure_count() const
{
  size_t n = 0;
  for (const auto & [id, r] : results) {
    if (r.has_error()) ++n;
  }
  return n;
}

Result<BatchResult> BatchEvaluator::evaluate(
  const FormulaTextMap & formulas, const FieldSnapshot & snapshot,
  const EvaluationOptions & options)
{
  auto parsed = parse_all(formulas, cache_);
  if (!parsed) {
    return std::move(parsed).error();
  }

  auto order = DependencyGraph::build(roots_of(parsed.value())).topological_order();
  if (!order) {
    return std::move(order).error();
  }

  BatchResult out;
  out.order = std::move(order).value();
  out.snapshot = snapshot;

  for (const auto & id : out.order) {
    const auto & formula = parsed.value().at(id);

    const auto started = std::chrono::steady_clock::now();
    auto value = Evaluator(out.snapshot, registry_).evaluate(formula->root());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (options.field_budget && elapsed > *options.field_budget) {
      out.over_budget.push_back(id);
    }

    if (value) {
      out.snapshot.insert_or_assign(id, value.value());
    } else {
      out.snapshot.erase(id);
    }
    out.results.emplace(id, std::move(value));
  }

  return out;
}

}  // namespace fieldcalc
