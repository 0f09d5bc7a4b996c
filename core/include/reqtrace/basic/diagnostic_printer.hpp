// reqtrace/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/basic/source_manager.hpp"

namespace reqtrace
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[broken-link]: REQ-d00003 references unknown REQ-p00999 (spec/dev.md:12)
 *     --> spec/dev.md:12:17
 *      |
 *   12 | **Implements**: REQ-p00999
 *      |                 ^^^^^^^^^^ no such requirement
 *      |
 *      = help: did you mean 'REQ-p00009'?
 *
 * Diagnostics without a registered document print the location only.
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print all diagnostics ordered by path and line.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace reqtrace
