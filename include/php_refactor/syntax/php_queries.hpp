// php_refactor/syntax/php_queries.hpp - Shared structural queries over PHP trees
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor
{

// ============================================================================
// Name helpers
// ============================================================================

inline constexpr char k_ns_separator = '\\';

/// Drop whitespace and a leading '\' from a name as written in source.
[[nodiscard]] std::string normalize_name(std::string_view written);

/// Last namespace segment ("App\Models\User" -> "User").
[[nodiscard]] std::string_view short_name(std::string_view fqn) noexcept;

/// Everything before the last separator ("App\Models\User" -> "App\Models").
[[nodiscard]] std::string_view namespace_part(std::string_view fqn) noexcept;

/// `ns\name`, or `name` when `ns` is empty.
[[nodiscard]] std::string join_fqn(std::string_view ns, std::string_view name);

/// Scalar and pseudo types that never need an import (case-insensitive).
[[nodiscard]] bool is_builtin_type_name(std::string_view name) noexcept;

/// self, static, parent (case-insensitive).
[[nodiscard]] bool is_relative_scope_name(std::string_view name) noexcept;

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Namespace and type declarations
// ============================================================================

struct NamespaceInfo
{
  std::string name;
  SourceRange declaration_range;  ///< `namespace` keyword through `;` (or the whole block)
  SourceRange name_range;
  bool braced = false;  ///< `namespace X { ... }` form
};

/// First namespace definition in the file.
[[nodiscard]] std::optional<NamespaceInfo> find_namespace(const SyntaxTree & tree);

struct TypeDeclaration
{
  SyntaxKind kind = SyntaxKind::ClassDeclaration;
  std::string name;
  std::string namespace_name;
  SourceRange name_range;
  SourceRange range;
  SyntaxNode node;

  [[nodiscard]] std::string fqn() const { return join_fqn(namespace_name, name); }
};

/// Every class, interface, trait and enum, in source order.
[[nodiscard]] std::vector<TypeDeclaration> find_type_declarations(const SyntaxTree & tree);

/// The first type declaration in the file.
[[nodiscard]] std::optional<TypeDeclaration> primary_type(const SyntaxTree & tree);

/// Innermost class-like declaration containing `offset`.
[[nodiscard]] std::optional<TypeDeclaration> enclosing_type_at(
  const SyntaxTree & tree, uint32_t offset);

// ============================================================================
// Imports
// ============================================================================

struct UseItem
{
  std::string fqn;              ///< without leading '\'
  std::string alias;            ///< effective short name
  bool explicit_alias = false;  ///< written with `as`
  SourceRange name_range;       ///< name as written in the clause
  SourceRange clause_range;
  SourceRange declaration_range;  ///< the whole `use ...;` statement
  bool in_group = false;
  std::string group_prefix;  ///< for `use A\{B, C}`: "A"
  size_t declaration_item_count = 1;
};

/// Class imports of a file (function and const imports are skipped).
class ImportTable
{
public:
  void add(UseItem item) { items_.push_back(std::move(item)); }

  [[nodiscard]] const std::vector<UseItem> & items() const noexcept { return items_; }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

  /// Import whose effective short name is `alias` (case-insensitive).
  [[nodiscard]] const UseItem * find_alias(std::string_view alias) const noexcept;

  [[nodiscard]] const UseItem * find_fqn(std::string_view fqn) const noexcept;

private:
  std::vector<UseItem> items_;
};

[[nodiscard]] ImportTable collect_imports(const SyntaxTree & tree);

/**
 * Resolve a class name as written to a fully-qualified name:
 * a leading '\' is absolute, a first segment matching an import expands it,
 * anything else is relative to `current_namespace`.
 */
[[nodiscard]] std::string resolve_class_name(
  std::string_view written, const ImportTable & imports, std::string_view current_namespace);

// ============================================================================
// Type hints and heritage
// ============================================================================

/// Class name of a single-class type hint; optional types are unwrapped.
/// Union, intersection and primitive types yield an empty string.
[[nodiscard]] std::string type_hint_name(SyntaxNode type_node);

/// Every class-name node inside a type hint (including union members).
[[nodiscard]] std::vector<SyntaxNode> type_name_nodes(SyntaxNode type_node);

struct NameRef
{
  std::string name;  ///< as written, normalized
  SourceRange range;
};

struct Heritage
{
  std::optional<NameRef> extends;   ///< class parent
  std::vector<NameRef> implements;  ///< implemented, or extended by an interface
};

[[nodiscard]] Heritage collect_heritage(SyntaxNode class_like);

// ============================================================================
// Type references
// ============================================================================

enum class TypeRefKind : uint8_t {
  Param,
  Return,
  Property,
  New,
  Static,
  Extends,
  Implements,
};

[[nodiscard]] const char * to_string(TypeRefKind kind) noexcept;

struct TypeReference
{
  TypeRefKind kind = TypeRefKind::Param;
  std::string written;  ///< normalized name as written
  bool fully_qualified = false;  ///< written with a leading '\'
  SourceRange range;

  [[nodiscard]] bool is_qualified() const noexcept
  {
    return written.find(k_ns_separator) != std::string::npos;
  }
};

/// Every position where a class name is referenced as a type.
[[nodiscard]] std::vector<TypeReference> collect_type_references(const SyntaxTree & tree);

/// Short names of every name and qualified-name node (coarse usage data).
[[nodiscard]] std::vector<std::string> collect_name_tokens(const SyntaxTree & tree);

}  // namespace php_refactor
