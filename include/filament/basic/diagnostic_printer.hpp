// filament/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context in Rust style.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "filament/basic/diagnostic.hpp"
#include "filament/basic/source_manager.hpp"

namespace filament
{

/**
 * Prints diagnostics like:
 *
 *   error[E021]: interval mismatch for argument 'left' of invocation 'm1'
 *     --> adder.fil:12:18
 *      |
 *   12 |   m1 := M3<G+4>(m0.out, a);
 *      |                         ^ supplied [G, G+1]
 *      |
 *      = note: required [G+4, G+5]
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colours
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace filament
