// celerrate/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context, line/column information
// and caret markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "celerrate/basic/diagnostic.hpp"
#include "celerrate/basic/source_manager.hpp"

namespace celerrate
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[D1001]: readonly properties require PHP 8.1 (active dialect is 8.0)
 *     --> src/Point.php:3:24
 *      |
 *    3 |   public function __construct(public readonly int $x) {}
 *      |                                      ^^^^^^^^ ignored
 *      |
 *      = help: raise php.version in celerrate.yaml
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Prints every diagnostic ordered by position.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceManager & source);
  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
    std::string_view label_message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace celerrate
