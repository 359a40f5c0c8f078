#include <gtest/gtest.h>

#include <string>

#include "fieldcalc/basic/diagnostic.hpp"
#include "fieldcalc/sema/analysis/formula_checker.hpp"
#include "fieldcalc/syntax/frontend.hpp"
#include "fieldcalc/test_support/parse_helpers.hpp"

using fieldcalc::DiagnosticBag;
using fieldcalc::FieldSchema;
using fieldcalc::FormulaChecker;
using fieldcalc::ResultType;

namespace
{

const FieldSchema & schema()
{
  static const FieldSchema s = {
    {"price", ResultType::Number},
    {"qty", ResultType::Number},
    {"name", ResultType::Text},
    {"active", ResultType::Boolean},
    {"total", ResultType::Unknown},
  };
  return s;
}

struct CheckOutcome
{
  bool ok = false;
  DiagnosticBag diags;
};

CheckOutcome check(const char * src)
{
  CheckOutcome out;
  auto f = fieldcalc::parse_formula(src);
  if (!f) {
    ADD_FAILURE() << src << ": " << f.error().message;
    return out;
  }
  FormulaChecker checker(fieldcalc::test_support::builtins(), schema());
  out.ok = checker.check(*f, out.diags);
  return out;
}

ResultType infer(const char * src)
{
  auto f = fieldcalc::parse_formula(src);
  if (!f) {
    ADD_FAILURE() << src << ": " << f.error().message;
    return ResultType::Unknown;
  }
  return FormulaChecker(fieldcalc::test_support::builtins(), schema()).infer_type(f->root());
}

}  // namespace

TEST(SemaFormulaChecker, CleanFormula)
{
  const auto r = check("round(price * qty, 2) > 10 and active");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
}

TEST(SemaFormulaChecker, UndefinedFieldsAreErrors)
{
  const auto r = check("price + discount + bonus");
  EXPECT_FALSE(r.ok);
  const auto errors = r.diags.errors();
  ASSERT_EQ(errors.size(), 2U);
  EXPECT_EQ(errors[0].message, "undefined field 'discount'");
  EXPECT_EQ(errors[0].code, "F0002");
  EXPECT_EQ(errors[0].range.get_begin().get_offset(), 8U);
  EXPECT_EQ(errors[1].message, "undefined field 'bonus'");
}

TEST(SemaFormulaChecker, UnknownFunctionListsAlternatives)
{
  const auto r = check("avg(price, qty)");
  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1U);
  const auto & d = r.diags.all().front();
  EXPECT_EQ(d.message, "unknown function 'avg'");
  EXPECT_EQ(d.code, "F0005");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_NE(d.help_message->find("max"), std::string::npos);
  EXPECT_EQ(d.range.get_end().get_offset(), 3U);
}

TEST(SemaFormulaChecker, WrongArgumentCount)
{
  const auto r = check("abs(price, qty)");
  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1U);
  const auto & d = r.diags.all().front();
  EXPECT_EQ(d.message, "abs() expects 1 argument, got 2");
  EXPECT_EQ(d.code, "F0006");
  EXPECT_EQ(d.label, "wrong number of arguments");
}

TEST(SemaFormulaChecker, ArgumentsOfBadCallsAreStillChecked)
{
  const auto r = check("nope(missing)");
  EXPECT_EQ(r.diags.errors().size(), 2U);
}

TEST(SemaFormulaChecker, TextArithmeticIsAWarning)
{
  const auto r = check("name + 1");
  EXPECT_TRUE(r.ok);
  ASSERT_EQ(r.diags.warnings().size(), 1U);
  const auto w = r.diags.warnings().front();
  EXPECT_EQ(w.message, "'+' applied to a text operand always fails");
  EXPECT_EQ(w.code, "W0001");

  const auto neg = check("-upper(name)");
  EXPECT_TRUE(neg.ok);
  ASSERT_EQ(neg.diags.warnings().size(), 1U);
  EXPECT_EQ(neg.diags.warnings().front().message, "'unary -' applied to a text operand always fails");
}

TEST(SemaFormulaChecker, UnknownTypesDoNotWarn)
{
  const auto r = check("total + max(price, name)");
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
}

TEST(SemaFormulaChecker, InferType)
{
  EXPECT_EQ(infer("1 + 2"), ResultType::Number);
  EXPECT_EQ(infer("'a'"), ResultType::Text);
  EXPECT_EQ(infer("price > 1"), ResultType::Boolean);
  EXPECT_EQ(infer("not name"), ResultType::Boolean);
  EXPECT_EQ(infer("-qty"), ResultType::Number);
  EXPECT_EQ(infer("name"), ResultType::Text);
  EXPECT_EQ(infer("upper(name)"), ResultType::Text);
  EXPECT_EQ(infer("coalesce(name, 1)"), ResultType::Unknown);
  EXPECT_EQ(infer("price or qty"), ResultType::Number);
  EXPECT_EQ(infer("price or name"), ResultType::Unknown);
  EXPECT_EQ(infer("null"), ResultType::Unknown);
  EXPECT_EQ(infer("unknown_field"), ResultType::Unknown);
}
