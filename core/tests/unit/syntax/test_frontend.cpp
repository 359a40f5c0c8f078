#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "fieldcalc/ast/ast_dumper.hpp"
#include "fieldcalc/syntax/frontend.hpp"

using fieldcalc::ErrorKind;
using fieldcalc::Formula;
using fieldcalc::FormulaCache;
using fieldcalc::parse_formula;

TEST(SyntaxFrontend, FormulaKeepsTextAndTree)
{
  auto f = parse_formula("a * 2");
  ASSERT_TRUE(f);
  EXPECT_EQ(f->text(), "a * 2");
  ASSERT_NE(f->root(), nullptr);
  EXPECT_EQ(fieldcalc::dump_sexpr(f->root()), "(* a 2)");
}

TEST(SyntaxFrontend, TreeSurvivesMove)
{
  auto parsed = parse_formula("concat(first_name, ' ', last_name)");
  ASSERT_TRUE(parsed);
  Formula moved = std::move(parsed).value();
  Formula again = std::move(moved);
  EXPECT_EQ(fieldcalc::dump_sexpr(again.root()), "(concat first_name \" \" last_name)");
}

TEST(SyntaxFrontend, CacheReturnsSameTreeForSameText)
{
  FormulaCache cache;
  auto a = cache.get("x + 1");
  auto b = cache.get("x + 1");
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(a->get(), b->get());
  EXPECT_EQ(cache.size(), 1U);

  auto c = cache.get("x+1");
  ASSERT_TRUE(c);
  EXPECT_NE(a->get(), c->get());
  EXPECT_EQ(cache.size(), 2U);
}

TEST(SyntaxFrontend, CacheDoesNotStoreFailures)
{
  FormulaCache cache;
  auto first = cache.get("1 +");
  ASSERT_FALSE(first);
  EXPECT_EQ(first.error().kind, ErrorKind::Syntax);
  EXPECT_EQ(cache.size(), 0U);

  auto second = cache.get("1 +");
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().message, first.error().message);
}

TEST(SyntaxFrontend, CacheClear)
{
  FormulaCache cache;
  ASSERT_TRUE(cache.get("1"));
  ASSERT_TRUE(cache.get("2"));
  EXPECT_EQ(cache.size(), 2U);
  cache.clear();
  EXPECT_EQ(cache.size(), 0U);
}

TEST(SyntaxFrontend, CacheIsBounded)
{
  FormulaCache cache(2);
  EXPECT_EQ(cache.capacity(), 2U);

  auto a = cache.get("a + 1");
  ASSERT_TRUE(cache.get("b + 1"));
  EXPECT_EQ(cache.size(), 2U);

  // A third formula flushes the full cache before it is stored
  ASSERT_TRUE(cache.get("c + 1"));
  EXPECT_EQ(cache.size(), 1U);

  // Trees handed out earlier stay valid
  ASSERT_TRUE(a);
  EXPECT_EQ(fieldcalc::dump_sexpr((*a)->root()), "(+ a 1)");

  auto again = cache.get("a + 1");
  ASSERT_TRUE(again);
  EXPECT_NE(again->get(), a->get());
  EXPECT_EQ(cache.size(), 2U);
}

TEST(SyntaxFrontend, ZeroCapacityCacheStoresNothing)
{
  FormulaCache cache(0);
  auto f = cache.get("1 + 2");
  ASSERT_TRUE(f);
  EXPECT_EQ(fieldcalc::dump_sexpr((*f)->root()), "(+ 1 2)");
  EXPECT_EQ(cache.size(), 0U);
}
