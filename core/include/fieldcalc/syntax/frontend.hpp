// fieldcalc/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/ast_context.hpp"
#include "fieldcalc/basic/error.hpp"

namespace fieldcalc
{

// ============================================================================
// Formula
// ============================================================================

/**
 * A parsed formula: the original text plus the AST built from it.
 *
 * The formula owns the arena its nodes live in, so the tree stays valid for
 * as long as the Formula object does (including after a move).
 */
class Formula
{
public:
  Formula(std::string text, std::unique_ptr<AstContext> ast, const Expr * root)
  : text_(std::move(text)), ast_(std::move(ast)), root_(root)
  {
  }

  Formula(Formula &&) noexcept = default;
  Formula & operator=(Formula &&) noexcept = default;
  Formula(const Formula &) = delete;
  Formula & operator=(const Formula &) = delete;
  ~Formula() = default;

  [[nodiscard]] const Expr * root() const noexcept { return root_; }
  [[nodiscard]] const std::string & text() const noexcept { return text_; }

private:
  std::string text_;
  std::unique_ptr<AstContext> ast_;
  const Expr * root_ = nullptr;
};

// Parse pipeline:
// text -> lexer (token stream) -> recursive-descent parser (AST)
[[nodiscard]] Result<Formula> parse_formula(std::string text);

// ============================================================================
// FormulaCache
// ============================================================================

/**
 * Memoizes parsed formulas by their exact text.
 *
 * Not thread-safe; each caller keeps its own cache. Parse failures are not
 * stored, so a failing text is re-parsed (and re-reported) on every lookup.
 * The cache holds at most `capacity()` formulas; inserting into a full cache
 * drops every entry first. Trees already handed out stay alive through their
 * shared pointers.
 */
class FormulaCache
{
public:
  static constexpr size_t k_default_capacity = 1024;

  explicit FormulaCache(size_t capacity = k_default_capacity) : capacity_(capacity) {}

  [[nodiscard]] Result<std::shared_ptr<const Formula>> get(std::string_view text);

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
  void clear() { entries_.clear(); }

private:
  size_t capacity_;
  std::unordered_map<std::string, std::shared_ptr<const Formula>> entries_;
};

}  // namespace fieldcalc
