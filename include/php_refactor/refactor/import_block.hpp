// php_refactor/refactor/import_block.hpp - Leading `use` block detection and import insertion
//
// Line-based so that it also works on files that currently fail to parse
// (quick-fixes are offered while the user is typing).
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/refactor/edit_set.hpp"

namespace php_refactor
{

struct ImportStatement
{
  std::string text;             ///< normalized: `use ...;` with a lowercase keyword
  std::vector<std::string> fqns;  ///< every class named by the statement
  uint32_t first_line = 0;      ///< 0-indexed
  uint32_t last_line = 0;       ///< 0-indexed, differs for multi-line group statements
};

struct ImportBlock
{
  /// Existing block: start of the first import line to the end of the last one.
  std::optional<SourceRange> range;
  std::vector<ImportStatement> statements;

  std::optional<uint32_t> namespace_line;  ///< 0-indexed
  std::optional<uint32_t> open_tag_line;   ///< 0-indexed line of `<?php`
  std::optional<uint32_t> declare_line;    ///< leading `declare(...)`, outside any namespace

  /// 0-indexed line a fresh block is inserted before
  uint32_t insert_line = 0;

  [[nodiscard]] bool contains_fqn(std::string_view fqn) const;
};

/**
 * Locate the leading import block.
 *
 * Lines are scanned top-down. The block starts at the first `use` line and
 * runs through further `use` lines and blank lines; it ends at the first
 * other line once an import was seen. Lines after the first type
 * declaration are never imports (trait `use` statements live there).
 */
[[nodiscard]] ImportBlock find_import_block(const SourceFile & file);

/// FQNs named by one `use` statement body (`A\{B, C as D}` -> A\B, A\C).
[[nodiscard]] std::vector<std::string> expand_use_statement(std::string_view statement);

/// Case-insensitive ordering with a byte-wise tie break.
[[nodiscard]] bool import_text_less(std::string_view a, std::string_view b);

/**
 * Edit that merges `fqns` into the file's import block and re-sorts it,
 * or inserts a fresh block. Returns std::nullopt when every FQN is already
 * imported.
 */
[[nodiscard]] std::optional<EditOperation> plan_import_edit(
  const SourceFile & file, const std::vector<std::string> & fqns);

}  // namespace php_refactor
