// fieldcalc/sema/analysis/dependency_graph.hpp - Calculated field graph + ordering
//
// Nodes are the calculated fields of one entity. An edge A -> B means the
// formula of A reads the calculated field B. References to fields without a
// formula come from the caller's snapshot and add no edges.
//
#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/basic/error.hpp"

namespace fieldcalc
{

/// Parsed formula root per calculated field id
using FieldAstMap = std::map<std::string, const Expr *, std::less<>>;

class DependencyGraph
{
public:
  DependencyGraph() = default;

  /// Build the graph for one batch. The ASTs are only read during the call.
  [[nodiscard]] static DependencyGraph build(const FieldAstMap & formulas);

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] std::vector<std::string> nodes() const;
  [[nodiscard]] bool contains(std::string_view id) const { return deps_.count(id) > 0; }
  [[nodiscard]] size_t size() const noexcept { return deps_.size(); }

  /// Every field name the formula reads, calculated or not (sorted)
  [[nodiscard]] std::vector<std::string> references_of(std::string_view id) const;

  /// Calculated fields that `id` reads directly (sorted)
  [[nodiscard]] std::vector<std::string> dependencies_of(std::string_view id) const;

  /// Calculated fields whose formula reads `id` directly (sorted)
  [[nodiscard]] std::vector<std::string> dependents_of(std::string_view id) const;

  // ===========================================================================
  // Analysis
  // ===========================================================================

  /**
   * Cycles found by a three-colour depth-first search.
   *
   * Each cycle lists its fields in edge order, rotated so that the smallest
   * id comes first; the closing edge back to the first field is implicit.
   * Duplicates are removed and the list is sorted.
   */
  [[nodiscard]] std::vector<std::vector<std::string>> find_cycles() const;

  /**
   * Evaluation order: every field after all calculated fields it reads.
   *
   * Among fields that are ready at the same time the smallest id goes first,
   * so the same input always yields the same order. Fails with a
   * CircularDependency error naming every field on every cycle.
   */
  [[nodiscard]] Result<std::vector<std::string>> topological_order() const;

private:
  using EdgeMap = std::map<std::string, std::set<std::string>, std::less<>>;

  EdgeMap refs_;   ///< id -> all referenced names
  EdgeMap deps_;   ///< id -> referenced calculated fields
  EdgeMap rdeps_;  ///< id -> calculated fields reading id
};

/// "a -> b -> a"
[[nodiscard]] std::string format_cycle(const std::vector<std::string> & cycle);

}  // namespace fieldcalc
