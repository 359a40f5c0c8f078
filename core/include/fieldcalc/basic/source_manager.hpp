// fieldcalc/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking positions inside formula text.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fieldcalc
{

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

/// Byte offset into a formula; default-constructed locations are invalid.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_ = k_invalid_offset;
};

/**
 * Half-open byte range [begin, end) of a token or expression.
 *
 * Every AST node and every FormulaError carries one; errors that are not
 * about a place in the text (cycles, mapping failures) keep the invalid
 * default.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourceLocation begin, SourceLocation end) noexcept
  : begin_(begin), end_(end)
  {
  }
  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(SourceLocation(begin_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  /// Length in bytes; 0 for an invalid range
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() ? end_.get_offset() - begin_.get_offset() : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Range from the start of `a` to the end of `b`. Invalid inputs are ignored.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

// ============================================================================
// SourceManager
// ============================================================================

/// 1-indexed line and column; both are 0 when unknown
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;
};

/**
 * One formula text plus the name it is reported under (usually the id of the
 * field that owns the formula). Maps byte offsets to line/column for the
 * diagnostic printer. Formulas are usually a single line, but YAML block
 * scalars can span several.
 */
class SourceManager
{
public:
  SourceManager() = default;
  SourceManager(std::string name, std::string text)
  : name_(std::move(name)), text_(std::move(text))
  {
    index_lines();
  }

  [[nodiscard]] const std::string & get_name() const noexcept { return name_; }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_starts_.size(); }

  /// Offsets past the end clamp to the end of the text
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Line `line_index` (0-indexed) without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Text covered by `range`, clamped to the text
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void index_lines();

  std::string name_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace fieldcalc
