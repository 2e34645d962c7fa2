// php_refactor/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/basic/source_manager.hpp"

namespace php_refactor
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[missing-import]: Class 'User' is not imported. Add 'use' statement.
 *     --> src/Http/UserController.php:9:25
 *      |
 *    9 |     public function show(User $user): void
 *      |                          ^^^^
 *      |
 *      = fix: Import App\Models\User
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

  /// Print a single diagnostic whose ranges refer to `source`.
  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics from a DiagnosticBag, sorted by position.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    std::string_view label_message);

  void print_fixit(const FixIt & fixit);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace php_refactor
