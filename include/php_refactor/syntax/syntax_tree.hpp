// php_refactor/syntax/syntax_tree.hpp - Normalized view over a tree-sitter PHP tree
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/syntax/ts_ll.hpp"

namespace php_refactor
{

// ============================================================================
// SyntaxKind
// ============================================================================

/// Grammar kinds the engine consumes. Everything else is `Other`.
enum class SyntaxKind : uint8_t {
#define PHP_SYNTAX_NODE(Kind, TsName, Snake) Kind,
#include "php_refactor/syntax/syntax_nodes.def"
  Other,
};

[[nodiscard]] SyntaxKind syntax_kind_from_ts(std::string_view ts_kind) noexcept;

[[nodiscard]] const char * to_string(SyntaxKind kind) noexcept;

/// True for class, interface, trait and enum declarations.
[[nodiscard]] bool is_class_like(SyntaxKind kind) noexcept;

/// True for methods, functions, closures and arrow functions.
[[nodiscard]] bool is_function_like(SyntaxKind kind) noexcept;

// ============================================================================
// ChildSlots - which children the generic walker descends into
// ============================================================================

struct ChildSlots
{
  enum class Mode : uint8_t {
    AllNamed,  ///< every named child
    Fields,    ///< only the listed grammar fields
    None,      ///< leaf for traversal purposes
  };

  Mode mode = Mode::AllNamed;
  std::array<std::string_view, 4> fields{};
  uint8_t field_count = 0;
};

[[nodiscard]] const ChildSlots & child_slots(SyntaxKind kind) noexcept;

// ============================================================================
// SyntaxNode
// ============================================================================

class SyntaxTree;

/**
 * Value handle on a tree node plus the text it was parsed from.
 * Cheap to copy; valid while the owning SyntaxTree is alive.
 */
class SyntaxNode
{
public:
  SyntaxNode() = default;
  SyntaxNode(ts_ll::Node node, std::string_view source) : node_(node), source_(source) {}

  [[nodiscard]] bool is_null() const noexcept { return node_.is_null(); }
  explicit operator bool() const noexcept { return !is_null(); }

  [[nodiscard]] SyntaxKind kind() const noexcept
  {
    return is_null() ? SyntaxKind::Other : syntax_kind_from_ts(node_.kind());
  }
  [[nodiscard]] std::string_view ts_kind() const noexcept { return node_.kind(); }

  [[nodiscard]] SourceRange range() const noexcept { return node_.range(); }
  [[nodiscard]] std::string_view text() const noexcept { return node_.text(source_); }

  [[nodiscard]] SyntaxNode field(std::string_view name) const noexcept
  {
    return {node_.child_by_field(name), source_};
  }

  /// Text of the `name` field (empty when absent)
  [[nodiscard]] std::string_view name_text() const noexcept { return field("name").text(); }

  [[nodiscard]] SyntaxNode parent() const noexcept { return {node_.parent(), source_}; }

  [[nodiscard]] std::vector<SyntaxNode> named_children() const;

  /// First named child whose kind is `kind`
  [[nodiscard]] SyntaxNode first_child_of(SyntaxKind kind) const;

  /// True when an unnamed child token spells `token` (e.g. "function" in `use function`)
  [[nodiscard]] bool has_token(std::string_view token) const;

  [[nodiscard]] const ts_ll::Node & raw() const noexcept { return node_; }
  [[nodiscard]] std::string_view source() const noexcept { return source_; }

  [[nodiscard]] bool operator==(const SyntaxNode & other) const noexcept
  {
    return node_ == other.node_;
  }

private:
  ts_ll::Node node_;
  std::string_view source_;
};

// ============================================================================
// SyntaxTree
// ============================================================================

/// A parsed PHP file. Owns the text, the line table and the tree-sitter tree.
class SyntaxTree
{
public:
  SyntaxTree(SourceFile file, ts_ll::Tree tree);

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree & operator=(const SyntaxTree &) = delete;

  [[nodiscard]] SyntaxNode root() const noexcept;
  [[nodiscard]] const SourceFile & file() const noexcept { return file_; }
  [[nodiscard]] const fs::path & path() const noexcept { return file_.path(); }
  [[nodiscard]] std::string_view text() const noexcept { return file_.content(); }

  [[nodiscard]] FullSourceRange full_range(SourceRange range) const noexcept
  {
    return file_.get_full_range(range);
  }

  /// Smallest named node covering `offset`
  [[nodiscard]] SyntaxNode node_at(uint32_t offset) const noexcept;

private:
  SourceFile file_;
  ts_ll::Tree tree_;
};

/**
 * Parse PHP source text.
 *
 * Returns nullptr when the produced tree contains error or missing nodes;
 * a `parse-error` diagnostic is reported into `diags` when given.
 * Throws std::runtime_error only when the grammar itself cannot be loaded.
 */
[[nodiscard]] std::unique_ptr<SyntaxTree> parse_php(
  const fs::path & path, std::string text, DiagnosticBag * diags = nullptr);

}  // namespace php_refactor
