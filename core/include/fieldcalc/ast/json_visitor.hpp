// fieldcalc/ast/json_visitor.hpp - JSON serialization for AST nodes
#pragma once

#include <nlohmann/json.hpp>

#include "fieldcalc/ast/ast.hpp"

namespace fieldcalc
{

/**
 * Serialize an AST node to JSON.
 *
 * Every node becomes an object with "type" and "range" ({"start", "end"}
 * byte offsets) plus its own fields; children are nested objects.
 *
 * @param node The AST node to serialize (nullptr yields a MissingExpr object)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

}  // namespace fieldcalc
