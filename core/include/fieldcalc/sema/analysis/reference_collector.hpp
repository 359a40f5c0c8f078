// fieldcalc/sema/analysis/reference_collector.hpp - Field reference extraction
#pragma once

#include <set>
#include <string>
#include <vector>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/visitor.hpp"

namespace fieldcalc
{

/**
 * Collects every FieldRefExpr of a tree in source order.
 *
 * Literals contribute nothing; operators and calls are walked into.
 * Duplicates are kept so callers can point diagnostics at each occurrence.
 */
class ReferenceCollector : public ConstRecursiveAstVisitor<ReferenceCollector>
{
public:
  bool visit_field_ref_expr(const FieldRefExpr * node)
  {
    refs_.push_back(node);
    return true;
  }

  [[nodiscard]] const std::vector<const FieldRefExpr *> & references() const noexcept
  {
    return refs_;
  }

private:
  std::vector<const FieldRefExpr *> refs_;
};

/// Names of all fields an expression reads, duplicates collapsed.
[[nodiscard]] std::set<std::string> extract_field_references(const Expr * expr);

}  // namespace fieldcalc
