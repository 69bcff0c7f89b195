// lineage/basic/diagnostic_printer.hpp
//
// Prints diagnostics with manifest location and help text in
// Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "lineage/basic/diagnostic.hpp"

namespace lineage
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E102]: node '1.1' in hierarchy 'firmware' already has a child
 *     --> lineage.yaml:12:11
 *      |
 *      = help: chain hierarchies allow one child per version
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
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace lineage
