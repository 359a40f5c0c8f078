// fieldcalc/syntax/lexer.hpp - Formula tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "fieldcalc/basic/error.hpp"
#include "fieldcalc/syntax/token.hpp"

namespace fieldcalc::syntax
{

/**
 * Converts formula text into tokens. The token vector always ends with an
 * Eof token; the first unrecognised character or unterminated string makes
 * the whole call fail with a Syntax error.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] Result<std::vector<Token>> lex_all();

private:
  [[nodiscard]] Result<Token> next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Result<Token> lex_string();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start, size_t len) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

/// Tokenize a whole formula.
[[nodiscard]] inline Result<std::vector<Token>> tokenize(std::string_view text)
{
  return Lexer(text).lex_all();
}

}  // namespace fieldcalc::syntax
