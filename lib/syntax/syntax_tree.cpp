// php_refactor/syntax/syntax_tree.cpp - Normalized view over a tree-sitter PHP tree
#include "php_refactor/syntax/syntax_tree.hpp"

#include <cctype>
#include <unordered_map>

namespace php_refactor
{

// ============================================================================
// SyntaxKind
// ============================================================================

SyntaxKind syntax_kind_from_ts(std::string_view ts_kind) noexcept
{
  static const std::unordered_map<std::string_view, SyntaxKind> table = {
#define PHP_SYNTAX_NODE(Kind, TsName, Snake) {TsName, SyntaxKind::Kind},
#define PHP_SYNTAX_ALIAS(Kind, TsName) {TsName, SyntaxKind::Kind},
#include "php_refactor/syntax/syntax_nodes.def"
  };

  const auto it = table.find(ts_kind);
  return it == table.end() ? SyntaxKind::Other : it->second;
}

const char * to_string(SyntaxKind kind) noexcept
{
  switch (kind) {
#define PHP_SYNTAX_NODE(Kind, TsName, Snake) \
  case SyntaxKind::Kind:                     \
    return #Snake;
#include "php_refactor/syntax/syntax_nodes.def"
    case SyntaxKind::Other:
      return "other";
  }
  return "other";
}

bool is_class_like(SyntaxKind kind) noexcept
{
  return kind == SyntaxKind::ClassDeclaration || kind == SyntaxKind::InterfaceDeclaration ||
         kind == SyntaxKind::TraitDeclaration || kind == SyntaxKind::EnumDeclaration;
}

bool is_function_like(SyntaxKind kind) noexcept
{
  return kind == SyntaxKind::MethodDeclaration || kind == SyntaxKind::FunctionDefinition ||
         kind == SyntaxKind::Closure || kind == SyntaxKind::ArrowFunction;
}

// ============================================================================
// Child slot table
// ============================================================================

namespace
{

constexpr ChildSlots k_all_named{};
constexpr ChildSlots k_leaf{ChildSlots::Mode::None, {}, 0};

constexpr ChildSlots fields(
  std::string_view a, std::string_view b = {}, std::string_view c = {}, std::string_view d = {})
{
  ChildSlots slots{ChildSlots::Mode::Fields, {a, b, c, d}, 0};
  for (const auto & f : slots.fields) {
    if (!f.empty()) ++slots.field_count;
  }
  return slots;
}

}  // namespace

const ChildSlots & child_slots(SyntaxKind kind) noexcept
{
  static constexpr ChildSlots k_namespace = fields("body");
  static constexpr ChildSlots k_function = fields("parameters", "body");
  static constexpr ChildSlots k_assignment = fields("left", "right");
  static constexpr ChildSlots k_member_call = fields("object", "arguments");
  static constexpr ChildSlots k_static_call = fields("scope", "arguments");
  static constexpr ChildSlots k_property_lookup = fields("object");
  static constexpr ChildSlots k_parameter = fields("default_value");

  switch (kind) {
    case SyntaxKind::NamespaceDefinition:
      return k_namespace;
    case SyntaxKind::MethodDeclaration:
    case SyntaxKind::FunctionDefinition:
    case SyntaxKind::Closure:
    case SyntaxKind::ArrowFunction:
      return k_function;
    case SyntaxKind::Assignment:
      return k_assignment;
    case SyntaxKind::MemberCall:
      return k_member_call;
    case SyntaxKind::StaticCall:
      return k_static_call;
    case SyntaxKind::PropertyLookup:
      return k_property_lookup;
    case SyntaxKind::SimpleParameter:
    case SyntaxKind::PromotedParameter:
      return k_parameter;
    case SyntaxKind::UseDeclaration:
    case SyntaxKind::UseClause:
    case SyntaxKind::UseGroup:
    case SyntaxKind::Variable:
    case SyntaxKind::Name:
    case SyntaxKind::QualifiedName:
    case SyntaxKind::NamespaceName:
    case SyntaxKind::RelativeScope:
    case SyntaxKind::NamedType:
    case SyntaxKind::OptionalType:
    case SyntaxKind::UnionType:
    case SyntaxKind::PrimitiveType:
      return k_leaf;
    default:
      return k_all_named;
  }
}

// ============================================================================
// SyntaxNode
// ============================================================================

std::vector<SyntaxNode> SyntaxNode::named_children() const
{
  std::vector<SyntaxNode> out;
  if (is_null()) {
    return out;
  }
  const uint32_t n = node_.named_child_count();
  out.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    out.emplace_back(node_.named_child(i), source_);
  }
  return out;
}

SyntaxNode SyntaxNode::first_child_of(SyntaxKind kind) const
{
  if (is_null()) {
    return {};
  }
  const uint32_t n = node_.named_child_count();
  for (uint32_t i = 0; i < n; ++i) {
    SyntaxNode c(node_.named_child(i), source_);
    if (c.kind() == kind) {
      return c;
    }
  }
  return {};
}

bool SyntaxNode::has_token(std::string_view token) const
{
  if (is_null()) {
    return false;
  }
  const uint32_t n = node_.child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node c = node_.child(i);
    if (c.is_named()) {
      continue;
    }
    const std::string_view t = c.text(source_);
    if (t.size() != token.size()) {
      continue;
    }
    bool same = true;
    for (size_t k = 0; k < t.size() && same; ++k) {
      same = std::tolower(static_cast<unsigned char>(t[k])) ==
             std::tolower(static_cast<unsigned char>(token[k]));
    }
    if (same) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// SyntaxTree
// ============================================================================

SyntaxTree::SyntaxTree(SourceFile file, ts_ll::Tree tree)
: file_(std::move(file)), tree_(std::move(tree))
{
}

SyntaxNode SyntaxTree::root() const noexcept { return {tree_.root_node(), file_.content()}; }

SyntaxNode SyntaxTree::node_at(uint32_t offset) const noexcept
{
  const ts_ll::Node r = tree_.root_node();
  if (r.is_null()) {
    return {};
  }
  return {r.named_descendant_for_range(offset, offset), file_.content()};
}

namespace
{

ts_ll::Node find_first_error(ts_ll::Node node)
{
  if (node.is_error() || node.is_missing()) {
    return node;
  }
  if (!node.has_error()) {
    return {};
  }
  const uint32_t n = node.child_count();
  for (uint32_t i = 0; i < n; ++i) {
    const ts_ll::Node found = find_first_error(node.child(i));
    if (!found.is_null()) {
      return found;
    }
  }
  return {};
}

}  // namespace

std::unique_ptr<SyntaxTree> parse_php(const fs::path & path, std::string text, DiagnosticBag * diags)
{
  const ts_ll::Parser parser;
  ts_ll::Tree tree(parser.parse_string(text));
  if (tree.is_null()) {
    if (diags) {
      diags->report_error(SourceRange(0, 0), "Failed to parse file")
        .with_code("parse-error")
        .with_source("php-refactor");
    }
    return nullptr;
  }

  const ts_ll::Node root = tree.root_node();
  if (root.has_error()) {
    if (diags) {
      const ts_ll::Node bad = find_first_error(root);
      const SourceRange where = bad.is_null() ? SourceRange(0, 0) : bad.range();
      const bool missing = !bad.is_null() && bad.is_missing();
      diags
        ->report_error(
          where, missing ? "Missing '" + std::string(bad.kind()) + "'" : std::string("Syntax error"),
          missing ? "expected here" : "unexpected input")
        .with_code("parse-error")
        .with_source("php-refactor");
    }
    return nullptr;
  }

  return std::make_unique<SyntaxTree>(SourceFile(path, std::move(text)), std::move(tree));
}

}  // namespace php_refactor
