// fieldcalc/ast/json_visitor.cpp - JSON serialization implementation
//
#include "fieldcalc/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/ast_enums.hpp"
#include "fieldcalc/basic/casting.hpp"
#include "fieldcalc/basic/source_manager.hpp"

namespace fieldcalc
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

uint32_t begin_off(SourceRange r) { return r.get_begin().get_offset(); }
uint32_t end_off(SourceRange r) { return r.get_end().get_offset(); }

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", begin_off(r)}, {"end", end_off(r)}};
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  if (isa<IntLiteralExpr>(e)) {
    const auto * lit = cast<IntLiteralExpr>(e);
    return json{
      {"type", "IntLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<FloatLiteralExpr>(e)) {
    const auto * lit = cast<FloatLiteralExpr>(e);
    return json{
      {"type", "FloatLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<StringLiteralExpr>(e)) {
    const auto * lit = cast<StringLiteralExpr>(e);
    return json{
      {"type", "StringLiteralExpr"},
      {"range", j_range(lit->get_range())},
      {"value", std::string(lit->value)}};
  }

  if (isa<BoolLiteralExpr>(e)) {
    const auto * lit = cast<BoolLiteralExpr>(e);
    return json{
      {"type", "BoolLiteralExpr"}, {"range", j_range(lit->get_range())}, {"value", lit->value}};
  }

  if (isa<NullLiteralExpr>(e)) {
    return json{{"type", "NullLiteralExpr"}, {"range", j_range(e->get_range())}};
  }

  if (isa<FieldRefExpr>(e)) {
    const auto * f = cast<FieldRefExpr>(e);
    return json{
      {"type", "FieldRefExpr"}, {"range", j_range(f->get_range())}, {"name", std::string(f->name)}};
  }

  if (isa<UnaryExpr>(e)) {
    const auto * u = cast<UnaryExpr>(e);
    return json{
      {"type", "UnaryExpr"},
      {"range", j_range(u->get_range())},
      {"op", std::string(to_string(u->op))},
      {"operand", j_expr(u->operand)}};
  }

  if (isa<BinaryExpr>(e)) {
    const auto * b = cast<BinaryExpr>(e);
    return json{
      {"type", "BinaryExpr"},
      {"range", j_range(b->get_range())},
      {"op", std::string(to_string(b->op))},
      {"lhs", j_expr(b->lhs)},
      {"rhs", j_expr(b->rhs)}};
  }

  if (isa<CallExpr>(e)) {
    const auto * c = cast<CallExpr>(e);
    json args = json::array();
    for (const auto * a : c->args) {
      args.push_back(j_expr(a));
    }
    return json{
      {"type", "CallExpr"},
      {"range", j_range(c->get_range())},
      {"callee", std::string(c->callee)},
      {"args", args}};
  }

  return json{{"type", "UnknownExpr"}, {"range", j_range(e->get_range())}};
}

}  // namespace

nlohmann::json to_json(const AstNode * node)
{
  if (!node) {
    return j_expr(nullptr);
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  return nlohmann::json{{"type", "UnknownNode"}, {"range", j_range(node->get_range())}};
}

}  // namespace fieldcalc
