// php_refactor/refactor/edit_planner.hpp - Multi-file refactoring edit computation
#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/index/symbol_index.hpp"
#include "php_refactor/project/autoload.hpp"
#include "php_refactor/refactor/edit_set.hpp"
#include "php_refactor/refactor/scope_tracker.hpp"

namespace php_refactor
{

/// PHP identifier: a letter, '_' or byte >= 0x80, then also digits.
[[nodiscard]] bool is_valid_identifier(std::string_view name) noexcept;

/**
 * Computes edits for method renames, file moves and import insertion.
 *
 * The planner reads the index but never mutates it. Every file it touches
 * is re-read and re-parsed at request time; a file that cannot be read or
 * parsed is skipped with a warning and never aborts the operation.
 */
class EditPlanner
{
public:
  EditPlanner(
    const SymbolIndex & index, const NamespaceResolver & resolver,
    const SourceRegistry * documents = nullptr, std::shared_ptr<spdlog::logger> logger = nullptr);

  /// Files considered for propagation. Defaults to every indexed file.
  void set_candidate_files(std::vector<fs::path> files) { candidates_ = std::move(files); }

  /**
   * Rename method `old_name` to `new_name`.
   *
   * The target type is taken from `cursor` (a byte offset in `file`) when
   * given: the class-like declaring `old_name` around the cursor, or the
   * resolved receiver of an `old_name` call at the cursor. Without a cursor
   * the first class-like in `file` declaring the method is used.
   */
  [[nodiscard]] RefactorResult rename_method(
    const fs::path & file, std::string_view old_name, std::string_view new_name,
    std::optional<uint32_t> cursor = std::nullopt) const;

  /**
   * Edits following a move of `old_path` to `new_path`: the moved file's
   * namespace and (when it follows the file name) type name, plus import and
   * reference updates in every other candidate file.
   */
  [[nodiscard]] RefactorResult move_file(const fs::path & old_path, const fs::path & new_path) const;

  /// Merge `fqns` into the import block of `file`.
  [[nodiscard]] RefactorResult add_imports(
    const fs::path & file, const std::vector<std::string> & fqns) const;

  /// Target chosen by rename_method(), exposed for callers that preview.
  [[nodiscard]] std::optional<RenameTarget> identify_rename_target(
    const SyntaxTree & tree, std::string_view method, std::optional<uint32_t> cursor,
    std::string * error = nullptr) const;

private:
  struct MoveContext;

  [[nodiscard]] std::optional<std::string> read(const fs::path & path) const;
  [[nodiscard]] std::vector<fs::path> candidate_files() const;
  [[nodiscard]] std::vector<std::string> implementor_fqns(std::string_view interface_fqn) const;
  [[nodiscard]] bool is_interface(std::string_view type_fqn) const;

  void plan_moved_file(MoveContext & ctx, const SyntaxTree & tree, EditSet & edits) const;
  void plan_referencing_file(
    MoveContext & ctx, const SyntaxTree & tree, EditSet & edits,
    std::vector<std::string> & warnings) const;

  const SymbolIndex & index_;
  const NamespaceResolver & resolver_;
  const SourceRegistry * documents_;
  std::shared_ptr<spdlog::logger> logger_;
  std::optional<std::vector<fs::path>> candidates_;
};

}  // namespace php_refactor
