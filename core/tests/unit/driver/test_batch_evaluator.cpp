#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "fieldcalc/driver/batch_evaluator.hpp"
#include "fieldcalc/test_support/parse_helpers.hpp"

using fieldcalc::BatchEvaluator;
using fieldcalc::ErrorKind;
using fieldcalc::FieldSnapshot;
using fieldcalc::FormulaTextMap;
using fieldcalc::Value;

namespace
{

using Strings = std::vector<std::string>;

const fieldcalc::FunctionRegistry & registry() { return fieldcalc::test_support::builtins(); }

}  // namespace

TEST(DriverBatchEvaluator, EvaluatesInDependencyOrder)
{
  const FormulaTextMap formulas = {
    {"total", "subtotal + tax"},
    {"subtotal", "price * qty"},
    {"tax", "subtotal * 0.25"},
  };
  const FieldSnapshot snapshot = {{"price", Value::make_integer(4)}, {"qty", Value::make_integer(5)}};

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, snapshot);
  ASSERT_TRUE(r);

  EXPECT_EQ(r->order, (Strings{"subtotal", "tax", "total"}));
  EXPECT_TRUE(r->all_succeeded());
  EXPECT_EQ(*r->results.at("subtotal"), Value::make_integer(20));
  EXPECT_EQ(*r->results.at("tax"), Value::make_float(5.0));
  EXPECT_EQ(*r->results.at("total"), Value::make_float(25.0));

  // The merged snapshot carries inputs and computed fields
  EXPECT_EQ(r->snapshot.at("price"), Value::make_integer(4));
  EXPECT_EQ(r->snapshot.at("total"), Value::make_float(25.0));
}

TEST(DriverBatchEvaluator, FieldFailureDoesNotAbortTheBatch)
{
  const FormulaTextMap formulas = {
    {"ratio", "x / y"},
    {"label", "concat('x=', x)"},
    {"scaled", "ratio * 100"},
  };
  const FieldSnapshot snapshot = {{"x", Value::make_integer(10)}, {"y", Value::make_integer(0)}};

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, snapshot);
  ASSERT_TRUE(r);

  EXPECT_EQ(r->failure_count(), 2U);
  EXPECT_FALSE(r->all_succeeded());

  const auto & ratio = r->results.at("ratio");
  ASSERT_FALSE(ratio);
  EXPECT_EQ(ratio.error().kind, ErrorKind::DivisionByZero);

  // A field reading a failed field sees it as undefined
  const auto & scaled = r->results.at("scaled");
  ASSERT_FALSE(scaled);
  EXPECT_EQ(scaled.error().kind, ErrorKind::UndefinedField);

  EXPECT_EQ(*r->results.at("label"), Value::make_text("x=10"));
  EXPECT_EQ(r->snapshot.count("ratio"), 0U);
}

TEST(DriverBatchEvaluator, StaleSnapshotValueIsDroppedOnFailure)
{
  const FormulaTextMap formulas = {{"ratio", "1 / 0"}};
  const FieldSnapshot snapshot = {{"ratio", Value::make_float(0.5)}};

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, snapshot);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->snapshot.count("ratio"), 0U);
}

TEST(DriverBatchEvaluator, SyntaxErrorAbortsWithFieldName)
{
  const FormulaTextMap formulas = {{"good", "1 + 1"}, {"bad", "1 +"}};

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, {});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(r.error().message, "field 'bad': unexpected end of formula, expected expression");
  ASSERT_FALSE(r.error().names.empty());
  EXPECT_EQ(r.error().names.front(), "bad");
}

TEST(DriverBatchEvaluator, CycleAbortsTheBatch)
{
  const FormulaTextMap formulas = {{"A", "B + 1"}, {"B", "A + 1"}, {"C", "1"}};

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, {});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind, ErrorKind::CircularDependency);
  EXPECT_EQ(r.error().names, (Strings{"A", "B"}));
}

TEST(DriverBatchEvaluator, FormulasAreParsedOnce)
{
  const FormulaTextMap formulas = {{"a", "x + 1"}, {"b", "x + 1"}, {"c", "a * b"}};

  BatchEvaluator batch(registry());
  ASSERT_TRUE(batch.evaluate(formulas, {{"x", Value::make_integer(1)}}));
  EXPECT_EQ(batch.cache().size(), 2U);

  auto again = batch.evaluate(formulas, {{"x", Value::make_integer(2)}});
  ASSERT_TRUE(again);
  EXPECT_EQ(batch.cache().size(), 2U);
  EXPECT_EQ(*again->results.at("c"), Value::make_integer(9));
}

TEST(DriverBatchEvaluator, CacheDoesNotGrowPastCapacity)
{
  BatchEvaluator batch(registry(), 2);
  for (int i = 0; i < 10; ++i) {
    const FormulaTextMap formulas = {{"a", "x + " + std::to_string(i)}, {"b", "a * 2"}};
    auto r = batch.evaluate(formulas, {{"x", Value::make_integer(1)}});
    ASSERT_TRUE(r);
    EXPECT_EQ(*r->results.at("b"), Value::make_integer(2 * (1 + i)));
    EXPECT_LE(batch.cache().size(), 2U);
  }
}

TEST(DriverBatchEvaluator, BudgetOverrunsAreReportedNotInterrupted)
{
  const FormulaTextMap formulas = {{"a", "1"}, {"b", "a + 1"}};

  fieldcalc::EvaluationOptions options;
  options.field_budget = std::chrono::milliseconds(-1);

  BatchEvaluator batch(registry());
  auto r = batch.evaluate(formulas, {}, options);
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->all_succeeded());
  EXPECT_EQ(r->over_budget, (Strings{"a", "b"}));
  EXPECT_EQ(*r->results.at("b"), Value::make_integer(2));
}

TEST(DriverBatchEvaluator, NoBudgetMeansNoOverruns)
{
  BatchEvaluator batch(registry());
  auto r = batch.evaluate({{"a", "1"}}, {});
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->over_budget.empty());
}

TEST(DriverBatchEvaluator, ComputeEvaluationOrder)
{
  auto order = fieldcalc::compute_evaluation_order({{"b", "a"}, {"a", "input"}, {"c", "2"}});
  ASSERT_TRUE(order);
  EXPECT_EQ(*order, (Strings{"a", "b", "c"}));

  auto bad = fieldcalc::compute_evaluation_order({{"x", "("}});
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().kind, ErrorKind::Syntax);
}
