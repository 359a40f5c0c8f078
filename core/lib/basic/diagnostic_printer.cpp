// fieldcalc/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "fieldcalc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace fieldcalc
{
namespace
{

constexpr std::string_view k_gutter = "      |";
constexpr size_t k_tab_width = 4;

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else {
      out += c;
    }
  }
  return out;
}

/// Display width of the text before 1-indexed `column`; columns past the
/// end of the line (errors at end of input) count one cell each
size_t width_before(std::string_view line, uint32_t column)
{
  size_t width = 0;
  for (size_t i = 0; i + 1 < column; ++i) {
    width += (i < line.size() && line[i] == '\t') ? k_tab_width : 1;
  }
  return width;
}

rang::fg severity_color(Severity s)
{
  return s == Severity::Error ? rang::fg::red : rang::fg::yellow;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  print_header(diag);

  if (diag.range.is_invalid()) {
    print_location(source.get_name());
    print_trailer(diag);
    return;
  }

  const LineColumn start = source.get_line_column(diag.range.get_begin().get_offset());
  const LineColumn end = source.get_line_column(diag.range.get_end().get_offset());
  print_location(fmt::format("{}:{}:{}", source.get_name(), start.line, start.column));
  accent(k_gutter);
  os_ << '\n';
  print_snippet(diag, source.get_line(start.line - 1), start, end);
  print_trailer(diag);
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
{
  std::vector<Diagnostic> sorted(diags.begin(), diags.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.range.get_begin() < b.range.get_begin();
  });

  for (const auto & d : sorted) {
    print(d, source);
  }
}

void DiagnosticPrinter::print_detached(const Diagnostic & diag, std::string_view origin)
{
  print_header(diag);
  print_location(origin);
  print_trailer(diag);
}

// =============================================================================
// Pieces
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", to_string(diag.severity), code, diag.message);
    return;
  }
  os_ << rang::style::bold << severity_color(diag.severity) << to_string(diag.severity) << code
      << rang::fg::reset << ": " << diag.message << rang::style::reset << '\n';
}

void DiagnosticPrinter::print_location(std::string_view where)
{
  accent("  -->");
  fmt::print(os_, " {}\n", where);
}

void DiagnosticPrinter::print_snippet(
  const Diagnostic & diag, std::string_view line, LineColumn start, LineColumn end)
{
  const size_t marker_len =
    (end.line == start.line && end.column > start.column) ? end.column - start.column : 1;

  // Source line: "    3 | text"
  if (use_color_) {
    os_ << rang::fg::cyan << fmt::format(" {:>4} ", start.line) << rang::fg::reset;
    accent("| ");
  } else {
    fmt::print(os_, " {:>4} | ", start.line);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Marker line: "      |     ^^^ label"
  accent(k_gutter);
  fmt::print(os_, " {}", std::string(width_before(line, start.column), ' '));
  if (use_color_) {
    os_ << severity_color(diag.severity) << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, '^'));
  if (!diag.label.empty()) {
    fmt::print(os_, " {}", diag.label);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_trailer(const Diagnostic & diag)
{
  for (const auto & note : diag.notes) {
    print_annotation("note", note);
  }
  if (diag.help_message) {
    print_annotation("help", *diag.help_message);
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_annotation(std::string_view kind, std::string_view text)
{
  accent(k_gutter);
  os_ << '\n';
  accent("   = ");
  fmt::print(os_, "{}: {}\n", kind, text);
}

void DiagnosticPrinter::accent(std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
  } else {
    os_ << text;
  }
}

}  // namespace fieldcalc
