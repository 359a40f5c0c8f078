#include "fieldcalc/syntax/frontend.hpp"

#include <utility>

#include "fieldcalc/syntax/lexer.hpp"
#include "fieldcalc/syntax/parser.hpp"

namespace fieldcalc
{

Result<Formula> parse_formula(std::string text)
{
  auto tokens = syntax::tokenize(text);
  if (!tokens) {
    return std::move(tokens).error();
  }

  auto ast = std::make_unique<AstContext>();
  syntax::Parser parser(*ast, std::move(tokens).value());
  auto root = parser.parse();
  if (!root) {
    return std::move(root).error();
  }

  // Nodes only reference arena-interned strings, never the token text
  return Formula(std::move(text), std::move(ast), root.value());
}

Result<std::shared_ptr<const Formula>> FormulaCache::get(std::string_view text)
{
  std::string key(text);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return it->second;
  }

  auto parsed = parse_formula(key);
  if (!parsed) {
    return std::move(parsed).error();
  }

  auto formula = std::make_shared<const Formula>(std::move(parsed).value());
  if (entries_.size() >= capacity_) {
    entries_.clear();
  }
  if (capacity_ == 0) {
    return std::shared_ptr<const Formula>(formula);
  }
  entries_.emplace(std::move(key), formula);
  return std::shared_ptr<const Formula>(formula);
}

}  // namespace fieldcalc
