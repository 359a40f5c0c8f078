// fieldcalc/sema/analysis/dependency_graph.cpp - Cycle detection + topological sort

#include "fieldcalc/sema/analysis/dependency_graph.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fieldcalc/sema/analysis/reference_collector.hpp"

namespace fieldcalc
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

template <typename Map>
std::vector<std::string> sorted_targets(const Map & m, std::string_view id)
{
  auto it = m.find(id);
  if (it == m.end()) return {};
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> rotate_to_smallest(std::vector<std::string> cycle)
{
  auto smallest = std::min_element(cycle.begin(), cycle.end());
  std::rotate(cycle.begin(), smallest, cycle.end());
  return cycle;
}

}  // namespace

std::string format_cycle(const std::vector<std::string> & cycle)
{
  std::string msg;
  for (const auto & id : cycle) {
    msg += id;
    msg += " -> ";
  }
  if (!cycle.empty()) {
    msg += cycle.front();
  }
  return msg;
}

DependencyGraph DependencyGraph::build(const FieldAstMap & formulas)
{
  DependencyGraph g;

  for (const auto & [id, root] : formulas) {
    g.deps_[id];
    g.rdeps_[id];
  }

  for (const auto & [id, root] : formulas) {
    auto names = extract_field_references(root);
    for (const auto & name : names) {
      if (formulas.count(name) == 0) continue;
      g.deps_[id].insert(name);
      g.rdeps_[name].insert(id);
    }
    g.refs_[id] = std::move(names);
  }

  return g;
}

std::vector<std::string> DependencyGraph::nodes() const
{
  std::vector<std::string> out;
  out.reserve(deps_.size());
  for (const auto & [id, _] : deps_) {
    out.push_back(id);
  }
  return out;
}

std::vector<std::string> DependencyGraph::references_of(std::string_view id) const
{
  return sorted_targets(refs_, id);
}

std::vector<std::string> DependencyGraph::dependencies_of(std::string_view id) const
{
  return sorted_targets(deps_, id);
}

std::vector<std::string> DependencyGraph::dependents_of(std::string_view id) const
{
  return sorted_targets(rdeps_, id);
}

std::vector<std::vector<std::string>> DependencyGraph::find_cycles() const
{
  std::unordered_map<std::string, Color> color;
  color.reserve(deps_.size());
  for (const auto & [id, _] : deps_) {
    color.emplace(id, Color::White);
  }

  std::vector<const std::string *> stack;
  std::set<std::vector<std::string>> found;

  std::function<void(const std::string &)> dfs;
  dfs = [&](const std::string & u) {
    color[u] = Color::Gray;
    stack.push_back(&u);

    for (const auto & v : deps_.find(u)->second) {
      const Color c = color[v];

      if (c == Color::Gray) {
        // Back edge: the cycle is the stack slice starting at v
        auto start = std::find_if(
          stack.begin(), stack.end(), [&](const std::string * s) { return *s == v; });
        std::vector<std::string> cycle;
        for (auto it = start; it != stack.end(); ++it) {
          cycle.push_back(**it);
        }
        found.insert(rotate_to_smallest(std::move(cycle)));
        continue;
      }
      if (c == Color::White) {
        dfs(v);
      }
    }

    stack.pop_back();
    color[u] = Color::Black;
  };

  for (const auto & [id, _] : deps_) {
    if (color[id] == Color::White) {
      dfs(id);
    }
  }

  return std::vector<std::vector<std::string>>(found.begin(), found.end());
}

Result<std::vector<std::string>> DependencyGraph::topological_order() const
{
  const auto cycles = find_cycles();
  if (!cycles.empty()) {
    std::set<std::string> on_cycle;
    std::string msg;
    for (const auto & cycle : cycles) {
      on_cycle.insert(cycle.begin(), cycle.end());
      if (!msg.empty()) msg += "; ";
      msg += format_cycle(cycle);
    }

    auto err = FormulaError::make(
      ErrorKind::CircularDependency, fmt::format("calculated fields form a cycle: {}", msg));
    err.names.assign(on_cycle.begin(), on_cycle.end());
    return err;
  }

  // Kahn's algorithm; the ready set is ordered so ties resolve by ascending id
  std::map<std::string_view, size_t> pending;
  std::set<std::string_view> ready;
  for (const auto & [id, deps] : deps_) {
    pending[id] = deps.size();
    if (deps.empty()) {
      ready.insert(id);
    }
  }

  std::vector<std::string> order;
  order.reserve(deps_.size());

  while (!ready.empty()) {
    const std::string_view next = *ready.begin();
    ready.erase(ready.begin());
    order.emplace_back(next);

    for (const auto & dependent : rdeps_.find(next)->second) {
      if (--pending[dependent] == 0) {
        ready.insert(dependent);
      }
    }
  }

  return order;
}

}  // namespace fieldcalc
