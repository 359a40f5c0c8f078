#include "fieldcalc/ast/ast_dumper.hpp"

#include <fmt/core.h>

#include <sstream>
#include <string>

#include "fieldcalc/ast/ast_enums.hpp"

namespace fieldcalc
{

void SexprPrinter::visit_int_literal_expr(const IntLiteralExpr * node) { os_ << node->value; }

void SexprPrinter::visit_float_literal_expr(const FloatLiteralExpr * node)
{
  std::string s = fmt::format("{}", node->value);
  if (s.find_first_of(".eEn") == std::string::npos) {
    s += ".0";
  }
  os_ << s;
}

void SexprPrinter::visit_string_literal_expr(const StringLiteralExpr * node)
{
  os_ << '"';
  for (const char c : node->value) {
    switch (c) {
      case '"':
        os_ << "\\\"";
        break;
      case '\\':
        os_ << "\\\\";
        break;
      case '\n':
        os_ << "\\n";
        break;
      case '\t':
        os_ << "\\t";
        break;
      case '\r':
        os_ << "\\r";
        break;
      default:
        os_ << c;
        break;
    }
  }
  os_ << '"';
}

void SexprPrinter::visit_bool_literal_expr(const BoolLiteralExpr * node)
{
  os_ << (node->value ? "true" : "false");
}

void SexprPrinter::visit_null_literal_expr(const NullLiteralExpr * /*node*/) { os_ << "null"; }

void SexprPrinter::visit_field_ref_expr(const FieldRefExpr * node) { os_ << node->name; }

void SexprPrinter::visit_unary_expr(const UnaryExpr * node)
{
  os_ << '(' << to_string(node->op) << ' ';
  visit(node->operand);
  os_ << ')';
}

void SexprPrinter::visit_binary_expr(const BinaryExpr * node)
{
  os_ << '(' << to_string(node->op) << ' ';
  visit(node->lhs);
  os_ << ' ';
  visit(node->rhs);
  os_ << ')';
}

void SexprPrinter::visit_call_expr(const CallExpr * node)
{
  os_ << '(' << node->callee;
  for (const auto * arg : node->args) {
    os_ << ' ';
    visit(arg);
  }
  os_ << ')';
}

std::string dump_sexpr(const Expr * expr)
{
  std::ostringstream ss;
  SexprPrinter printer(ss);
  printer.visit(expr);
  return ss.str();
}

}  // namespace fieldcalc
