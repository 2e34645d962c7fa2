// php_refactor/refactor/edit_set.hpp - Text edit operations and non-overlapping edit sets
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <gsl/span>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/basic/source_manager.hpp"

namespace php_refactor
{

// ============================================================================
// EditOperation
// ============================================================================

/// One (file, range, replacement) unit of a refactoring.
struct EditOperation
{
  std::filesystem::path target_file;
  FullSourceRange range;
  std::string replacement_text;

  [[nodiscard]] bool is_insertion() const noexcept { return range.start_byte == range.end_byte; }

  [[nodiscard]] bool operator==(const EditOperation & other) const
  {
    return target_file == other.target_file && range == other.range &&
           replacement_text == other.replacement_text;
  }
};

/// Half-open overlap; two insertions at the same offset also overlap.
[[nodiscard]] bool ranges_overlap(const FullSourceRange & a, const FullSourceRange & b) noexcept;

/**
 * Apply edits of one file to its text, back to front.
 *
 * Operations must not overlap (EditSet guarantees this).
 */
[[nodiscard]] std::string apply_edits(std::string_view text, gsl::span<const EditOperation> ops);

// ============================================================================
// EditSet
// ============================================================================

/**
 * Ordered, deduplicated, non-overlapping collection of edits.
 *
 * Per file, operations are kept sorted by start offset. An identical
 * duplicate is dropped silently; an operation overlapping an accepted one in
 * the same file is rejected and logged.
 */
class EditSet
{
public:
  explicit EditSet(std::shared_ptr<spdlog::logger> logger = nullptr);

  /// Returns false when `op` was rejected for overlapping an accepted edit.
  bool add(EditOperation op);

  [[nodiscard]] bool empty() const noexcept { return by_file_.empty(); }
  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] size_t rejected_count() const noexcept { return rejected_; }

  /// Every operation, grouped by file (sorted by path), each group by offset.
  [[nodiscard]] std::vector<EditOperation> operations() const;

  [[nodiscard]] std::vector<EditOperation> for_file(const std::filesystem::path & file) const;

  [[nodiscard]] std::vector<std::filesystem::path> files() const;

private:
  std::shared_ptr<spdlog::logger> logger_;
  std::map<std::string, std::vector<EditOperation>> by_file_;
  size_t rejected_ = 0;
};

// ============================================================================
// RefactorResult
// ============================================================================

/**
 * Outcome of a planner operation. A refusal carries a message and no edits.
 */
struct RefactorResult
{
  bool success = false;
  std::string error;
  std::vector<EditOperation> edits;

  /// Non-fatal notes (skipped files, untouched group imports, ...)
  std::vector<std::string> warnings;

  static RefactorResult ok(std::vector<EditOperation> edits)
  {
    RefactorResult r;
    r.success = true;
    r.edits = std::move(edits);
    return r;
  }

  static RefactorResult fail(std::string msg)
  {
    RefactorResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

}  // namespace php_refactor
