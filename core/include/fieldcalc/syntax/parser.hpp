// fieldcalc/syntax/parser.hpp - Recursive-descent formula parser
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fieldcalc/ast/ast.hpp"
#include "fieldcalc/ast/ast_context.hpp"
#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/syntax/token.hpp"

namespace fieldcalc::syntax
{

/**
 * Parses one formula expression from a token stream.
 *
 * Precedence, lowest first:
 *   or < and < not < comparison < + - < * / % < ** < unary + - < primary
 *
 * Parsing stops at the first error; no partial tree is returned.
 *
 * Recursion is bounded: parentheses, call arguments and prefix or power
 * operators may nest at most k_max_nesting_depth levels, and a formula may
 * contain at most k_max_operators binary operators. Both limits keep the
 * tree shallow enough for the recursive evaluator and visitors.
 */
class Parser
{
public:
  static constexpr size_t k_max_nesting_depth = 256;
  static constexpr size_t k_max_operators = 4096;

  Parser(AstContext & ast, std::vector<Token> tokens) : ast_(ast), tokens_(std::move(tokens)) {}

  [[nodiscard]] Result<const Expr *> parse();

private:
  /// Counts one level of recursive descent for its lifetime
  class DepthScope
  {
  public:
    explicit DepthScope(size_t & depth) : depth_(depth) { ++depth_; }
    ~DepthScope() { --depth_; }
    DepthScope(const DepthScope &) = delete;
    DepthScope & operator=(const DepthScope &) = delete;

  private:
    size_t & depth_;
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view msg);

  /// Record the first error; later calls are ignored
  void error_at(const Token & t, std::string msg);
  [[nodiscard]] static std::string describe(const Token & t);

  // Limits; both record an error and return true when exceeded
  [[nodiscard]] bool nesting_exceeded();
  [[nodiscard]] bool operator_limit_exceeded(const Token & op);

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_not();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_power();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_call(const Token & name_tok);
  [[nodiscard]] Expr * parse_number(const Token & t);

  [[nodiscard]] static std::string unescape_string(std::string_view raw);

  AstContext & ast_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  size_t depth_ = 0;
  size_t operators_ = 0;
  std::optional<FormulaError> error_;
};

}  // namespace fieldcalc::syntax
