// fieldcalc/basic/diagnostic_printer.hpp - Rust-style diagnostic output
#pragma once

#include <iosfwd>
#include <string_view>

#include "fieldcalc/basic/diagnostic.hpp"
#include "fieldcalc/basic/source_manager.hpp"

namespace fieldcalc
{

/**
 * Prints diagnostics in Rust style:
 *
 *   error[F0005]: unknown function 'avg'
 *     --> total:1:1
 *         |
 *       1 | avg(a, b)
 *         | ^^^ unknown function
 *         |
 *      = help: available functions: abs, concat, ...
 *
 * Colors are emitted only when `use_color` is set.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic with the source line its range points into
  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic of the bag, ordered by position
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

  /// Print a diagnostic that has no source text, located only by `origin`
  void print_detached(const Diagnostic & diag, std::string_view origin);

private:
  void print_header(const Diagnostic & diag);
  void print_location(std::string_view where);
  void print_snippet(
    const Diagnostic & diag, std::string_view line, LineColumn start, LineColumn end);
  void print_trailer(const Diagnostic & diag);
  void print_annotation(std::string_view kind, std::string_view text);

  /// Gutter and arrow text, bold cyan when colored
  void accent(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace fieldcalc
