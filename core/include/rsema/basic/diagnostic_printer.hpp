// rsema/basic/diagnostic_printer.hpp
//
// Prints diagnostics in Rust-style format with HIR locations, labels,
// notes and help lines.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "rsema/basic/diagnostic.hpp"

namespace rsema
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0301]: lifetime cycle detected: 'a -> 'b -> 'a
 *     --> main.json: fn swap
 *      |
 *      | ^ 'a must outlive 'b (where clause)
 *      | - 'b must outlive 'a (where clause)
 *      |
 *      = help: remove one of the outlives bounds
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

  /**
   * Print a single diagnostic.
   *
   * @param diag Diagnostic to print
   * @param origin Input the diagnostic came from (file name), may be empty
   */
  void print(const Diagnostic & diag, std::string_view origin = {});

  /// Print all diagnostics from a DiagnosticBag, errors first.
  void print_all(const DiagnosticBag & diags, std::string_view origin = {});

  /// Print the trailing "N errors, M warnings" summary line.
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace rsema
