#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/basic/casting.hpp"
#include "fieldcalc/syntax/frontend.hpp"
#include "fieldcalc/test_support/parse_helpers.hpp"

using fieldcalc::ErrorKind;
using fieldcalc::test_support::parse_error;
using fieldcalc::test_support::sexpr;

// ============================================================================
// Literals and atoms
// ============================================================================

TEST(SyntaxParser, Literals)
{
  EXPECT_EQ(sexpr("42"), "42");
  EXPECT_EQ(sexpr("1.5"), "1.5");
  EXPECT_EQ(sexpr("2.0"), "2.0");
  EXPECT_EQ(sexpr("1e3"), "1000.0");
  EXPECT_EQ(sexpr("true"), "true");
  EXPECT_EQ(sexpr("FALSE"), "false");
  EXPECT_EQ(sexpr("Null"), "null");
  EXPECT_EQ(sexpr("'single'"), "\"single\"");
  EXPECT_EQ(sexpr("price"), "price");
}

TEST(SyntaxParser, IntegerOutOfRangeBecomesFloat)
{
  auto f = fieldcalc::parse_formula("99999999999999999999");
  ASSERT_TRUE(f);
  const auto * lit = fieldcalc::dyn_cast<fieldcalc::FloatLiteralExpr>(f->root());
  ASSERT_NE(lit, nullptr);
  EXPECT_DOUBLE_EQ(lit->value, 1e20);
}

TEST(SyntaxParser, StringEscapes)
{
  EXPECT_EQ(sexpr(R"("a\nb")"), R"("a\nb")");
  EXPECT_EQ(sexpr(R"("say \"hi\"")"), R"("say \"hi\"")");
  EXPECT_EQ(sexpr(R"('it\'s')"), R"("it's")");
  EXPECT_EQ(sexpr(R"("back\\slash")"), R"("back\\slash")");

  auto f = fieldcalc::parse_formula(R"("tab\there")");
  ASSERT_TRUE(f);
  const auto * lit = fieldcalc::dyn_cast<fieldcalc::StringLiteralExpr>(f->root());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, "tab\there");
}

TEST(SyntaxParser, UnknownEscapeDropsBackslash)
{
  auto f = fieldcalc::parse_formula(R"("a\qb")");
  ASSERT_TRUE(f);
  const auto * lit = fieldcalc::dyn_cast<fieldcalc::StringLiteralExpr>(f->root());
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, "aqb");

  EXPECT_EQ(sexpr(R"('x\dy')"), R"("xdy")");
}

// ============================================================================
// Precedence and associativity
// ============================================================================

TEST(SyntaxParser, ArithmeticPrecedence)
{
  EXPECT_EQ(sexpr("1 + 2 * 3"), "(+ 1 (* 2 3))");
  EXPECT_EQ(sexpr("(1 + 2) * 3"), "(* (+ 1 2) 3)");
  EXPECT_EQ(sexpr("a - b - c"), "(- (- a b) c)");
  EXPECT_EQ(sexpr("a / b % c"), "(% (/ a b) c)");
  EXPECT_EQ(sexpr("2 * 3 ** 2"), "(* 2 (** 3 2))");
}

TEST(SyntaxParser, PowerIsRightAssociative)
{
  EXPECT_EQ(sexpr("2 ** 3 ** 2"), "(** 2 (** 3 2))");
}

TEST(SyntaxParser, UnaryBindsTighterThanPower)
{
  EXPECT_EQ(sexpr("-2 ** 2"), "(** (- 2) 2)");
  EXPECT_EQ(sexpr("2 ** -1"), "(** 2 (- 1))");
  EXPECT_EQ(sexpr("--x"), "(- (- x))");
  EXPECT_EQ(sexpr("+x"), "(+ x)");
}

TEST(SyntaxParser, ComparisonAndLogic)
{
  EXPECT_EQ(sexpr("a + 1 > b"), "(> (+ a 1) b)");
  EXPECT_EQ(sexpr("1 < 2 < 3"), "(< (< 1 2) 3)");
  EXPECT_EQ(sexpr("a or b and c"), "(or a (and b c))");
  EXPECT_EQ(sexpr("a and b or c"), "(or (and a b) c)");
  EXPECT_EQ(sexpr("not a == b"), "(not (== a b))");
  EXPECT_EQ(sexpr("not not x"), "(not (not x))");
  EXPECT_EQ(sexpr("x != 1 AND y <= 2"), "(and (!= x 1) (<= y 2))");
}

TEST(SyntaxParser, FunctionCalls)
{
  EXPECT_EQ(sexpr("now()"), "(now)");
  EXPECT_EQ(sexpr("max(a, \"b\")"), "(max a \"b\")");
  EXPECT_EQ(sexpr("round(a / 3, 2) + 1"), "(+ (round (/ a 3) 2) 1)");
  EXPECT_EQ(sexpr("upper(concat(a, b))"), "(upper (concat a b))");
}

TEST(SyntaxParser, RangesCoverTheWholeExpression)
{
  auto f = fieldcalc::parse_formula("  a + max(1, 2)");
  ASSERT_TRUE(f);
  const auto * bin = fieldcalc::dyn_cast<fieldcalc::BinaryExpr>(f->root());
  ASSERT_NE(bin, nullptr);
  EXPECT_EQ(bin->get_range().get_begin().get_offset(), 2U);
  EXPECT_EQ(bin->get_range().get_end().get_offset(), 15U);
  EXPECT_EQ(bin->op_range.get_begin().get_offset(), 4U);

  const auto * call = fieldcalc::dyn_cast<fieldcalc::CallExpr>(bin->rhs);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->callee, "max");
  EXPECT_EQ(call->callee_range.get_begin().get_offset(), 6U);
  EXPECT_EQ(call->callee_range.get_end().get_offset(), 9U);
  EXPECT_EQ(call->args.size(), 2U);
}

TEST(SyntaxParser, ParsingIsDeterministic)
{
  const std::string src = "if_else(a > 1, upper(b), coalesce(c, 'x')) or not d";
  EXPECT_EQ(sexpr(src), sexpr(src));
  EXPECT_EQ(sexpr(src), "(or (if_else (> a 1) (upper b) (coalesce c \"x\")) (not d))");
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxParser, EmptyFormula)
{
  const auto e = parse_error("   ");
  EXPECT_EQ(e.kind, ErrorKind::Syntax);
  EXPECT_EQ(e.message, "empty formula");
}

TEST(SyntaxParser, TrailingTokens)
{
  const auto e = parse_error("1 2 3");
  EXPECT_EQ(e.kind, ErrorKind::Syntax);
  EXPECT_EQ(e.message, "unexpected token '2'");
  EXPECT_EQ(e.range.get_begin().get_offset(), 2U);
}

TEST(SyntaxParser, MissingOperand)
{
  EXPECT_EQ(parse_error("1 +").message, "unexpected end of formula, expected expression");
  EXPECT_EQ(parse_error("* 2").message, "unexpected token '*', expected expression");
  EXPECT_EQ(parse_error("a and").message, "unexpected end of formula, expected expression");
  EXPECT_EQ(parse_error("1 \"x\"").message, "unexpected token string \"x\"");
}

TEST(SyntaxParser, UnbalancedParentheses)
{
  EXPECT_EQ(parse_error("(1 + 2").message, "expected ')' after expression, found end of formula");
  EXPECT_EQ(parse_error("1 + 2)").message, "unexpected token ')'");
  EXPECT_EQ(parse_error("()").message, "unexpected token ')', expected expression");
}

TEST(SyntaxParser, MalformedCalls)
{
  EXPECT_EQ(parse_error("max(1 2)").message, "expected ',' or ')' in function call, found '2'");
  EXPECT_EQ(parse_error("max(1,)").message, "unexpected token ')', expected expression");
  EXPECT_EQ(
    parse_error("max(1").message, "expected ',' or ')' in function call, found end of formula");
}

TEST(SyntaxParser, LexerErrorsSurfaceThroughParse)
{
  const auto e = parse_error("a # b");
  EXPECT_EQ(e.kind, ErrorKind::Syntax);
  EXPECT_EQ(e.message, "unexpected character '#'");
}

// ============================================================================
// Resource limits
// ============================================================================

namespace
{

std::string repeat(std::string_view piece, size_t n)
{
  std::string out;
  out.reserve(piece.size() * n);
  for (size_t i = 0; i < n; ++i) out += piece;
  return out;
}

}  // namespace

TEST(SyntaxParser, NestingWithinLimitParses)
{
  const std::string src = repeat("(", 200) + "1" + repeat(")", 200);
  EXPECT_EQ(sexpr(src), "1");
  EXPECT_EQ(sexpr(repeat("-", 200) + "1").substr(0, 6), "(- (- ");
}

TEST(SyntaxParser, DeepNestingIsSyntaxError)
{
  const std::string parens = repeat("(", 200000) + "1" + repeat(")", 200000);
  const auto e = parse_error(parens);
  EXPECT_EQ(e.kind, ErrorKind::Syntax);
  EXPECT_EQ(e.message, "expression nested too deeply (limit 256)");
  EXPECT_TRUE(e.range.is_valid());

  EXPECT_EQ(parse_error(repeat("f(", 1000) + "1" + repeat(")", 1000)).message,
    "expression nested too deeply (limit 256)");
  EXPECT_EQ(parse_error(repeat("-", 100000) + "1").message,
    "expression nested too deeply (limit 256)");
  EXPECT_EQ(parse_error(repeat("not ", 100000) + "true").message,
    "expression nested too deeply (limit 256)");
  EXPECT_EQ(parse_error(repeat("2 ** ", 100000) + "2").message,
    "expression nested too deeply (limit 256)");
}

TEST(SyntaxParser, LongOperatorChainIsSyntaxError)
{
  // 1000 additions stay within the operator budget
  EXPECT_TRUE(fieldcalc::parse_formula(repeat("1 + ", 1000) + "1"));

  const auto e = parse_error(repeat("x + ", 100000) + "x");
  EXPECT_EQ(e.kind, ErrorKind::Syntax);
  EXPECT_EQ(e.message, "formula has too many operators (limit 4096)");
  EXPECT_EQ(e.range.size(), 1U);
}
