#include "fieldcalc/sema/analysis/reference_collector.hpp"

namespace fieldcalc
{

std::set<std::string> extract_field_references(const Expr * expr)
{
  ReferenceCollector collector;
  collector.visit(expr);

  std::set<std::string> names;
  for (const auto * ref : collector.references()) {
    names.emplace(ref->name);
  }
  return names;
}

}  // namespace fieldcalc
