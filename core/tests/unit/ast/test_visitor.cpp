#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/visitor.hpp"
#include "fieldcalc/syntax/frontend.hpp"

using namespace fieldcalc;

namespace
{

class NodeCounter : public ConstRecursiveAstVisitor<NodeCounter>
{
  using Base = ConstRecursiveAstVisitor<NodeCounter>;

public:
  bool visit_expr(const Expr * /*node*/)
  {
    ++leaves;
    return true;
  }

  bool visit_call_expr(const CallExpr * node)
  {
    callees.emplace_back(node->callee);
    return Base::visit_call_expr(node);
  }

  int leaves = 0;
  std::vector<std::string> callees;
};

// Stops the walk at the first string literal
class FirstString : public ConstRecursiveAstVisitor<FirstString>
{
public:
  bool visit_string_literal_expr(const StringLiteralExpr * node)
  {
    found = std::string(node->value);
    return false;
  }

  bool visit_field_ref_expr(const FieldRefExpr * /*node*/)
  {
    ++fields_seen;
    return true;
  }

  std::string found;
  int fields_seen = 0;
};

}  // namespace

TEST(AstVisitor, RecursiveVisitorReachesEveryLeaf)
{
  auto f = parse_formula("max(a, b + 1) * -c");
  ASSERT_TRUE(f);

  NodeCounter counter;
  EXPECT_TRUE(counter.visit(f->root()));
  EXPECT_EQ(counter.leaves, 4);  // a, b, 1, c
  ASSERT_EQ(counter.callees.size(), 1U);
  EXPECT_EQ(counter.callees[0], "max");
}

TEST(AstVisitor, ReturningFalseStopsTheWalk)
{
  auto f = parse_formula("concat(a, 'x', b, 'y')");
  ASSERT_TRUE(f);

  FirstString v;
  EXPECT_FALSE(v.visit(f->root()));
  EXPECT_EQ(v.found, "x");
  EXPECT_EQ(v.fields_seen, 1);
}

TEST(AstVisitor, NullNodeIsIgnored)
{
  NodeCounter counter;
  EXPECT_FALSE(counter.visit(nullptr));
  EXPECT_EQ(counter.leaves, 0);
}
