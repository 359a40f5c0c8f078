#include "fieldcalc/sema/analysis/formula_checker.hpp"

#include <fmt/core.h>

#include "fieldcalc/ast/visitor.hpp"
#include "fieldcalc/basic/casting.hpp"
#include "fieldcalc/basic/error.hpp"

namespace fieldcalc
{

namespace
{

constexpr std::string_view k_text_operand_code = "W0001";

class CheckVisitor : public ConstRecursiveAstVisitor<CheckVisitor>
{
  using Base = ConstRecursiveAstVisitor<CheckVisitor>;

public:
  CheckVisitor(
    const FormulaChecker & checker, const FunctionRegistry & registry, const FieldSchema & schema,
    DiagnosticBag & diags)
  : checker_(checker), registry_(registry), schema_(schema), diags_(diags)
  {
  }

  bool visit_field_ref_expr(const FieldRefExpr * node)
  {
    if (schema_.count(node->name) == 0) {
      diags_.report(FormulaError::undefined_field(node->name, node->get_range()));
      ++errors_;
    }
    return true;
  }

  bool visit_call_expr(const CallExpr * node)
  {
    const FunctionSpec * spec = registry_.find(node->callee);
    if (spec == nullptr) {
      // The registry builds the message and the list of available names
      auto err = registry_.call(node->callee, {}, node->callee_range).error();
      diags_.report(err);
      ++errors_;
    } else if (!spec->accepts(node->args.size())) {
      diags_
        .report_error(
          node->get_range(),
          fmt::format(
            "{}() expects {}, got {}", spec->name, spec->arity_text(), node->args.size()),
          "wrong number of arguments")
        .with_code(std::string(error_code(ErrorKind::FunctionArgument)));
      ++errors_;
    }
    return Base::visit_call_expr(node);
  }

  bool visit_binary_expr(const BinaryExpr * node)
  {
    if (is_arithmetic(node->op)) {
      warn_if_text(node->lhs, to_string(node->op));
      warn_if_text(node->rhs, to_string(node->op));
    }
    return Base::visit_binary_expr(node);
  }

  bool visit_unary_expr(const UnaryExpr * node)
  {
    if (node->op != UnaryOp::Not) {
      warn_if_text(node->operand, fmt::format("unary {}", to_string(node->op)));
    }
    return Base::visit_unary_expr(node);
  }

  [[nodiscard]] size_t errors() const noexcept { return errors_; }

private:
  void warn_if_text(const Expr * operand, std::string_view op)
  {
    if (checker_.infer_type(operand) != ResultType::Text) return;
    diags_
      .report_warning(
        operand->get_range(), fmt::format("'{}' applied to a text operand always fails", op),
        "this is text")
      .with_code(std::string(k_text_operand_code));
  }

  const FormulaChecker & checker_;
  const FunctionRegistry & registry_;
  const FieldSchema & schema_;
  DiagnosticBag & diags_;
  size_t errors_ = 0;
};

}  // namespace

bool FormulaChecker::check(const Formula & formula, DiagnosticBag & diags) const
{
  return check(formula.root(), diags);
}

bool FormulaChecker::check(const Expr * root, DiagnosticBag & diags) const
{
  CheckVisitor visitor(*this, registry_, schema_, diags);
  visitor.visit(root);
  return visitor.errors() == 0;
}

ResultType FormulaChecker::infer_type(const Expr * expr) const
{
  if (expr == nullptr) return ResultType::Unknown;

  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
      return ResultType::Number;
    case NodeKind::StringLiteral:
      return ResultType::Text;
    case NodeKind::BoolLiteral:
      return ResultType::Boolean;
    case NodeKind::NullLiteral:
      return ResultType::Unknown;

    case NodeKind::FieldRef: {
      auto it = schema_.find(cast<FieldRefExpr>(expr)->name);
      return (it == schema_.end()) ? ResultType::Unknown : it->second;
    }

    case NodeKind::UnaryExpr:
      return (cast<UnaryExpr>(expr)->op == UnaryOp::Not) ? ResultType::Boolean
                                                         : ResultType::Number;

    case NodeKind::BinaryExpr: {
      const auto * b = cast<BinaryExpr>(expr);
      if (is_comparison(b->op)) return ResultType::Boolean;
      if (is_arithmetic(b->op)) return ResultType::Number;
      // and/or yield one of their operands
      const ResultType l = infer_type(b->lhs);
      return (l == infer_type(b->rhs)) ? l : ResultType::Unknown;
    }

    case NodeKind::CallExpr: {
      const FunctionSpec * spec = registry_.find(cast<CallExpr>(expr)->callee);
      return spec ? spec->result : ResultType::Unknown;
    }
  }
  return ResultType::Unknown;
}

}  // namespace fieldcalc
