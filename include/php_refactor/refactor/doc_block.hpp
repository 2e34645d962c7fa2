// php_refactor/refactor/doc_block.hpp - PHPDoc generation for classes and functions
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/refactor/edit_set.hpp"
#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor
{

/// The parts of an existing `/** ... */` block that a regenerated one keeps.
struct DocComment
{
  struct Param
  {
    std::string type;  ///< empty when the tag names no type
    std::string name;  ///< without `$` or `...`
    std::string description;
  };

  std::vector<std::string> description;
  std::vector<Param> params;
  std::optional<std::string> return_tag;  ///< text after `@return`
  std::vector<std::string> other_tags;    ///< e.g. `@throws RuntimeException`, in order

  [[nodiscard]] const Param * param(std::string_view name) const;
};

[[nodiscard]] DocComment parse_doc_comment(std::string_view text);

struct DocBlockAction
{
  std::string title;  ///< "Generate PHPDoc for method", "Update PHPDoc for class", ...
  EditOperation edit;
};

/**
 * PHPDoc actions for the declarations at `offset`.
 *
 * Every function or method whose lines contain the cursor line gets an
 * action; a class only when the cursor is on its first line. A block
 * directly above the declaration (blank lines allowed in between) is
 * replaced in place, keeping its descriptions, parameter notes and
 * unrelated tags; otherwise a fresh block is inserted above the
 * declaration with its indentation.
 */
[[nodiscard]] std::vector<DocBlockAction> plan_doc_block_actions(
  const SyntaxTree & tree, uint32_t offset);

}  // namespace php_refactor
