// php_refactor/basic/diagnostic.hpp - Diagnostic types for parsing and import checks
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "php_refactor/basic/source_manager.hpp"

namespace php_refactor
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] const char * to_string(Severity severity) noexcept;

/// A source range underlined in the diagnostic output.
struct Label
{
  SourceRange range;
  std::string message;
};

/// A suggested edit within the diagnostic's own file.
struct FixIt
{
  SourceRange range;
  std::string replacement_text;
  std::string title;  // e.g. "Import App\Models\User"
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "missing-import"
  std::string message;  // main message
  std::string source;   // producer, e.g. "php-refactor" or "phpstan"

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and adds it to the bag
 * when destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_source(std::string source);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement, std::string title = "");

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> with_code(const std::string & code) const;
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace php_refactor
