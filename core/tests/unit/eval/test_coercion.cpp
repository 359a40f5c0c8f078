#include <gtest/gtest.h>

#include "fieldcalc/eval/coercion.hpp"

using fieldcalc::coerce;
using fieldcalc::ErrorKind;
using fieldcalc::OutputTarget;
using fieldcalc::Value;

TEST(EvalCoercion, TextNeverFails)
{
  EXPECT_EQ(*coerce(Value::make_float(15.0), OutputTarget::Text), Value::make_text("15.0"));
  EXPECT_EQ(*coerce(Value::make_float(0.25), OutputTarget::Text), Value::make_text("0.25"));
  EXPECT_EQ(*coerce(Value::make_integer(-3), OutputTarget::Text), Value::make_text("-3"));
  EXPECT_EQ(*coerce(Value::make_bool(true), OutputTarget::Text), Value::make_text("true"));
  EXPECT_EQ(*coerce(Value::make_null(), OutputTarget::Text), Value::make_text(""));
  EXPECT_EQ(*coerce(Value::make_text("abc"), OutputTarget::Text), Value::make_text("abc"));
}

TEST(EvalCoercion, NumberAcceptsOnlyNumbers)
{
  EXPECT_EQ(*coerce(Value::make_integer(4), OutputTarget::Number), Value::make_float(4.0));
  EXPECT_EQ(*coerce(Value::make_float(2.5), OutputTarget::Number), Value::make_float(2.5));
}

TEST(EvalCoercion, NumberRejectsEverythingElse)
{
  const auto b = coerce(Value::make_bool(true), OutputTarget::Number);
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error().kind, ErrorKind::Coercion);
  EXPECT_EQ(b.error().message, "cannot coerce boolean to NUMBER");

  const auto t = coerce(Value::make_text("42"), OutputTarget::Number);
  ASSERT_FALSE(t);
  EXPECT_EQ(t.error().message, "cannot coerce text to NUMBER");

  const auto n = coerce(Value::make_null(), OutputTarget::Number);
  ASSERT_FALSE(n);
  EXPECT_EQ(n.error().message, "cannot coerce null to NUMBER");
}

TEST(EvalCoercion, BooleanUsesTruthiness)
{
  EXPECT_EQ(*coerce(Value::make_null(), OutputTarget::Boolean), Value::make_bool(false));
  EXPECT_EQ(*coerce(Value::make_bool(true), OutputTarget::Boolean), Value::make_bool(true));
  EXPECT_EQ(*coerce(Value::make_integer(0), OutputTarget::Boolean), Value::make_bool(false));
  EXPECT_EQ(*coerce(Value::make_float(0.1), OutputTarget::Boolean), Value::make_bool(true));
  EXPECT_EQ(*coerce(Value::make_text(""), OutputTarget::Boolean), Value::make_bool(false));
  EXPECT_EQ(*coerce(Value::make_text("false"), OutputTarget::Boolean), Value::make_bool(true));
}

TEST(EvalCoercion, ParseOutputTarget)
{
  EXPECT_EQ(fieldcalc::parse_output_target("TEXT"), OutputTarget::Text);
  EXPECT_EQ(fieldcalc::parse_output_target("number"), OutputTarget::Number);
  EXPECT_EQ(fieldcalc::parse_output_target("Boolean"), OutputTarget::Boolean);
  EXPECT_FALSE(fieldcalc::parse_output_target("date").has_value());
  EXPECT_FALSE(fieldcalc::parse_output_target("").has_value());
}
