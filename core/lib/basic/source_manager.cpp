// fieldcalc/basic/source_manager.cpp - Line index and slicing
#include "fieldcalc/basic/source_manager.hpp"

#include <algorithm>

namespace fieldcalc
{

void SourceManager::index_lines()
{
  line_starts_.assign(1, 0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  if (line_starts_.empty()) {
    return {};
  }
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));

  // Last line start not after `offset`; line_starts_[0] is 0 so one exists
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - line_starts_.begin());
  return {line, offset - line_starts_[line - 1] + 1};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  const size_t begin = line_starts_[line_index];
  size_t end = (line_index + 1 < line_starts_.size()) ? line_starts_[line_index + 1] : text_.size();
  while (end > begin && (text_[end - 1] == '\n' || text_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(text_).substr(begin, end - begin);
}

std::string_view SourceManager::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid() || range.get_begin().get_offset() >= text_.size()) {
    return {};
  }
  const size_t begin = range.get_begin().get_offset();
  const size_t end = std::min<size_t>(range.get_end().get_offset(), text_.size());
  return std::string_view(text_).substr(begin, end > begin ? end - begin : 0);
}

}  // namespace fieldcalc
