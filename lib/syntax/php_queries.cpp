// php_refactor/syntax/php_queries.cpp - Shared structural queries over PHP trees
#include "php_refactor/syntax/php_queries.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "php_refactor/syntax/syntax_walker.hpp"

namespace php_refactor
{

// ============================================================================
// Name helpers
// ============================================================================

std::string normalize_name(std::string_view written)
{
  std::string out;
  out.reserve(written.size());
  for (const char c : written) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out += c;
    }
  }
  if (!out.empty() && out.front() == k_ns_separator) {
    out.erase(0, 1);
  }
  return out;
}

std::string_view short_name(std::string_view fqn) noexcept
{
  const auto pos = fqn.rfind(k_ns_separator);
  return pos == std::string_view::npos ? fqn : fqn.substr(pos + 1);
}

std::string_view namespace_part(std::string_view fqn) noexcept
{
  const auto pos = fqn.rfind(k_ns_separator);
  if (pos == std::string_view::npos) {
    return {};
  }
  std::string_view ns = fqn.substr(0, pos);
  if (!ns.empty() && ns.front() == k_ns_separator) {
    ns.remove_prefix(1);
  }
  return ns;
}

std::string join_fqn(std::string_view ns, std::string_view name)
{
  if (ns.empty()) {
    return std::string(name);
  }
  std::string out(ns);
  out += k_ns_separator;
  out += name;
  return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool is_builtin_type_name(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 14> k_builtins = {
    "int",      "string",   "bool",  "float", "array", "object", "callable",
    "iterable", "void",     "mixed", "never", "null",  "true",   "false",
  };
  return std::any_of(k_builtins.begin(), k_builtins.end(), [name](std::string_view b) {
    return iequals(name, b);
  });
}

bool is_relative_scope_name(std::string_view name) noexcept
{
  return iequals(name, "self") || iequals(name, "static") || iequals(name, "parent");
}

namespace
{

bool is_name_node(SyntaxKind k) noexcept
{
  return k == SyntaxKind::Name || k == SyntaxKind::QualifiedName ||
         k == SyntaxKind::NamespaceName;
}

/// Written form without whitespace; a leading '\' is kept.
std::string written_name(SyntaxNode node)
{
  std::string out;
  for (const char c : node.text()) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out += c;
    }
  }
  return out;
}

SyntaxNode first_name_child(SyntaxNode node)
{
  for (const SyntaxNode & c : node.named_children()) {
    if (is_name_node(c.kind())) {
      return c;
    }
  }
  return {};
}

}  // namespace

// ============================================================================
// Namespace and type declarations
// ============================================================================

std::optional<NamespaceInfo> find_namespace(const SyntaxTree & tree)
{
  for (const SyntaxNode & child : tree.root().named_children()) {
    if (child.kind() != SyntaxKind::NamespaceDefinition) {
      continue;
    }

    SyntaxNode name = child.field("name");
    if (name.is_null()) {
      name = child.first_child_of(SyntaxKind::NamespaceName);
    }

    NamespaceInfo info;
    info.name = name.is_null() ? std::string() : normalize_name(name.text());
    info.name_range = name.is_null() ? SourceRange() : name.range();
    info.braced = !child.field("body").is_null();
    info.declaration_range = child.range();

    if (!info.braced) {
      // End at the first ';' after the keyword so trailing trivia is untouched.
      const std::string_view text = tree.text();
      const auto semi = text.find(';', child.range().get_begin().offset());
      if (semi != std::string_view::npos) {
        info.declaration_range =
          SourceRange(child.range().get_begin().offset(), static_cast<uint32_t>(semi + 1));
      }
    }
    return info;
  }
  return std::nullopt;
}

namespace
{

class TypeDeclarationCollector : public SyntaxWalker<TypeDeclarationCollector>
{
public:
  explicit TypeDeclarationCollector(std::vector<TypeDeclaration> & out) : out_(out) {}

  bool visit_namespace_definition(SyntaxNode node)
  {
    SyntaxNode name = node.field("name");
    if (name.is_null()) {
      name = node.first_child_of(SyntaxKind::NamespaceName);
    }
    const std::string ns = name.is_null() ? std::string() : normalize_name(name.text());

    const SyntaxNode body = node.field("body");
    if (body.is_null()) {
      current_namespace_ = ns;
      return false;
    }
    const std::string saved = current_namespace_;
    current_namespace_ = ns;
    walk(body);
    current_namespace_ = saved;
    return false;
  }

  bool visit_class_declaration(SyntaxNode node) { return record(node); }
  bool visit_interface_declaration(SyntaxNode node) { return record(node); }
  bool visit_trait_declaration(SyntaxNode node) { return record(node); }
  bool visit_enum_declaration(SyntaxNode node) { return record(node); }

private:
  bool record(SyntaxNode node)
  {
    const SyntaxNode name = node.field("name");
    if (!name.is_null()) {
      TypeDeclaration decl;
      decl.kind = node.kind();
      decl.name = std::string(name.text());
      decl.namespace_name = current_namespace_;
      decl.name_range = name.range();
      decl.range = node.range();
      decl.node = node;
      out_.push_back(std::move(decl));
    }
    return true;
  }

  std::vector<TypeDeclaration> & out_;
  std::string current_namespace_;
};

}  // namespace

std::vector<TypeDeclaration> find_type_declarations(const SyntaxTree & tree)
{
  std::vector<TypeDeclaration> out;
  TypeDeclarationCollector collector(out);
  collector.walk(tree.root());
  return out;
}

std::optional<TypeDeclaration> primary_type(const SyntaxTree & tree)
{
  auto decls = find_type_declarations(tree);
  if (decls.empty()) {
    return std::nullopt;
  }
  return std::move(decls.front());
}

std::optional<TypeDeclaration> enclosing_type_at(const SyntaxTree & tree, uint32_t offset)
{
  std::optional<TypeDeclaration> best;
  for (auto & decl : find_type_declarations(tree)) {
    if (!decl.range.touches(SourceLocation(offset))) {
      continue;
    }
    if (!best || decl.range.size() < best->range.size()) {
      best = std::move(decl);
    }
  }
  return best;
}

// ============================================================================
// Imports
// ============================================================================

const UseItem * ImportTable::find_alias(std::string_view alias) const noexcept
{
  for (const auto & item : items_) {
    if (iequals(item.alias, alias)) {
      return &item;
    }
  }
  return nullptr;
}

const UseItem * ImportTable::find_fqn(std::string_view fqn) const noexcept
{
  const std::string wanted = normalize_name(fqn);
  for (const auto & item : items_) {
    if (iequals(item.fqn, wanted)) {
      return &item;
    }
  }
  return nullptr;
}

namespace
{

class ImportCollector : public SyntaxWalker<ImportCollector>
{
public:
  explicit ImportCollector(ImportTable & table) : table_(table) {}

  bool visit_use_declaration(SyntaxNode decl)
  {
    if (decl.has_token("function") || decl.has_token("const")) {
      return false;
    }

    const SyntaxNode group = decl.first_child_of(SyntaxKind::UseGroup);
    const SyntaxNode prefix = decl.first_child_of(SyntaxKind::NamespaceName);
    const SyntaxNode clause_parent = group.is_null() ? decl : group;

    std::vector<SyntaxNode> clauses;
    for (const SyntaxNode & c : clause_parent.named_children()) {
      if (c.kind() == SyntaxKind::UseClause) {
        clauses.push_back(c);
      }
    }

    const std::string prefix_text = prefix.is_null() ? std::string() : normalize_name(prefix.text());

    for (const SyntaxNode & clause : clauses) {
      if (clause.has_token("function") || clause.has_token("const")) {
        continue;
      }
      SyntaxNode name_node;
      SyntaxNode alias_node = clause.field("alias");
      for (const SyntaxNode & c : clause.named_children()) {
        if (name_node.is_null() && is_name_node(c.kind())) {
          name_node = c;
        } else if (alias_node.is_null() && c.kind() == SyntaxKind::Name) {
          alias_node = c;
        } else if (alias_node.is_null() && c.ts_kind() == "namespace_aliasing_clause") {
          alias_node = c.first_child_of(SyntaxKind::Name);
        }
      }
      if (name_node.is_null() || name_node == alias_node) {
        continue;
      }

      UseItem item;
      const std::string written = normalize_name(name_node.text());
      item.fqn = group.is_null() ? written : join_fqn(prefix_text, written);
      item.explicit_alias = !alias_node.is_null();
      item.alias =
        item.explicit_alias ? std::string(alias_node.text()) : std::string(short_name(item.fqn));
      item.name_range = name_node.range();
      item.clause_range = clause.range();
      item.declaration_range = decl.range();
      item.in_group = !group.is_null();
      item.group_prefix = prefix_text;
      item.declaration_item_count = clauses.size();
      table_.add(std::move(item));
    }
    return false;
  }

private:
  ImportTable & table_;
};

}  // namespace

ImportTable collect_imports(const SyntaxTree & tree)
{
  ImportTable table;
  ImportCollector collector(table);
  collector.walk(tree.root());
  return table;
}

std::string resolve_class_name(
  std::string_view written, const ImportTable & imports, std::string_view current_namespace)
{
  if (written.empty()) {
    return {};
  }
  if (written.front() == k_ns_separator) {
    return normalize_name(written);
  }

  const std::string name = normalize_name(written);
  const auto sep = name.find(k_ns_separator);
  const std::string_view first = std::string_view(name).substr(0, sep);

  if (const UseItem * item = imports.find_alias(first)) {
    if (sep == std::string::npos) {
      return item->fqn;
    }
    return item->fqn + name.substr(sep);
  }
  return join_fqn(current_namespace, name);
}

// ============================================================================
// Type hints and heritage
// ============================================================================

std::string type_hint_name(SyntaxNode type_node)
{
  if (type_node.is_null()) {
    return {};
  }
  switch (type_node.kind()) {
    case SyntaxKind::Name:
    case SyntaxKind::QualifiedName:
      return written_name(type_node);
    case SyntaxKind::NamedType: {
      const SyntaxNode inner = first_name_child(type_node);
      return written_name(inner.is_null() ? type_node : inner);
    }
    case SyntaxKind::OptionalType: {
      const auto children = type_node.named_children();
      return children.empty() ? std::string() : type_hint_name(children.front());
    }
    case SyntaxKind::UnionType:
    case SyntaxKind::PrimitiveType:
      return {};
    default: {
      const auto children = type_node.named_children();
      return children.size() == 1 ? type_hint_name(children.front()) : std::string();
    }
  }
}

std::vector<SyntaxNode> type_name_nodes(SyntaxNode type_node)
{
  std::vector<SyntaxNode> out;
  if (type_node.is_null()) {
    return out;
  }
  switch (type_node.kind()) {
    case SyntaxKind::Name:
    case SyntaxKind::QualifiedName:
      out.push_back(type_node);
      break;
    case SyntaxKind::NamedType: {
      const SyntaxNode inner = first_name_child(type_node);
      out.push_back(inner.is_null() ? type_node : inner);
      break;
    }
    case SyntaxKind::PrimitiveType:
      break;
    default:
      for (const SyntaxNode & c : type_node.named_children()) {
        auto nested = type_name_nodes(c);
        out.insert(out.end(), nested.begin(), nested.end());
      }
      break;
  }
  return out;
}

Heritage collect_heritage(SyntaxNode class_like)
{
  Heritage h;
  const bool is_interface = class_like.kind() == SyntaxKind::InterfaceDeclaration;

  for (const SyntaxNode & clause : class_like.named_children()) {
    if (clause.kind() == SyntaxKind::BaseClause) {
      for (const SyntaxNode & n : clause.named_children()) {
        if (!is_name_node(n.kind())) {
          continue;
        }
        NameRef ref{normalize_name(n.text()), n.range()};
        if (is_interface) {
          h.implements.push_back(std::move(ref));
        } else if (!h.extends) {
          h.extends = std::move(ref);
        }
      }
    } else if (clause.kind() == SyntaxKind::InterfaceClause) {
      for (const SyntaxNode & n : clause.named_children()) {
        if (is_name_node(n.kind())) {
          h.implements.push_back(NameRef{normalize_name(n.text()), n.range()});
        }
      }
    }
  }
  return h;
}

// ============================================================================
// Type references
// ============================================================================

const char * to_string(TypeRefKind kind) noexcept
{
  switch (kind) {
    case TypeRefKind::Param:
      return "param";
    case TypeRefKind::Return:
      return "return";
    case TypeRefKind::Property:
      return "property";
    case TypeRefKind::New:
      return "new";
    case TypeRefKind::Static:
      return "static";
    case TypeRefKind::Extends:
      return "extends";
    case TypeRefKind::Implements:
      return "implements";
  }
  return "param";
}

namespace
{

class TypeReferenceCollector : public SyntaxWalker<TypeReferenceCollector>
{
public:
  explicit TypeReferenceCollector(std::vector<TypeReference> & out) : out_(out) {}

  bool visit_simple_parameter(SyntaxNode node)
  {
    add_type(node.field("type"), TypeRefKind::Param);
    return true;
  }
  bool visit_promoted_parameter(SyntaxNode node)
  {
    add_type(node.field("type"), TypeRefKind::Param);
    return true;
  }
  bool visit_property_declaration(SyntaxNode node)
  {
    add_type(node.field("type"), TypeRefKind::Property);
    return true;
  }

  bool visit_method_declaration(SyntaxNode node) { return function_like(node); }
  bool visit_function_definition(SyntaxNode node) { return function_like(node); }
  bool visit_closure(SyntaxNode node) { return function_like(node); }
  bool visit_arrow_function(SyntaxNode node) { return function_like(node); }

  bool visit_new_expression(SyntaxNode node)
  {
    const auto children = node.named_children();
    if (!children.empty()) {
      add_name(children.front(), TypeRefKind::New);
    }
    return true;
  }

  bool visit_static_call(SyntaxNode node)
  {
    add_name(node.field("scope"), TypeRefKind::Static);
    return true;
  }
  bool visit_static_property_lookup(SyntaxNode node)
  {
    add_name(node.field("scope"), TypeRefKind::Static);
    return true;
  }
  bool visit_class_constant_lookup(SyntaxNode node)
  {
    const auto children = node.named_children();
    if (!children.empty()) {
      add_name(children.front(), TypeRefKind::Static);
    }
    return true;
  }

  bool visit_class_declaration(SyntaxNode node) { return class_like(node); }
  bool visit_interface_declaration(SyntaxNode node) { return class_like(node); }
  bool visit_enum_declaration(SyntaxNode node) { return class_like(node); }

private:
  bool function_like(SyntaxNode node)
  {
    add_type(node.field("return_type"), TypeRefKind::Return);
    return true;
  }

  bool class_like(SyntaxNode node)
  {
    const bool is_interface = node.kind() == SyntaxKind::InterfaceDeclaration;
    for (const SyntaxNode & clause : node.named_children()) {
      if (clause.kind() == SyntaxKind::BaseClause) {
        for (const SyntaxNode & n : clause.named_children()) {
          add_name(n, is_interface ? TypeRefKind::Implements : TypeRefKind::Extends);
        }
      } else if (clause.kind() == SyntaxKind::InterfaceClause) {
        for (const SyntaxNode & n : clause.named_children()) {
          add_name(n, TypeRefKind::Implements);
        }
      }
    }
    return true;
  }

  void add_type(SyntaxNode type, TypeRefKind kind)
  {
    for (const SyntaxNode & n : type_name_nodes(type)) {
      add_name(n, kind);
    }
  }

  void add_name(SyntaxNode n, TypeRefKind kind)
  {
    if (n.is_null() || (n.kind() != SyntaxKind::Name && n.kind() != SyntaxKind::QualifiedName)) {
      return;
    }
    const std::string written = written_name(n);
    if (written.empty()) {
      return;
    }
    TypeReference ref;
    ref.kind = kind;
    ref.fully_qualified = written.front() == k_ns_separator;
    ref.written = normalize_name(written);
    ref.range = n.range();
    out_.push_back(std::move(ref));
  }

  std::vector<TypeReference> & out_;
};

}  // namespace

std::vector<TypeReference> collect_type_references(const SyntaxTree & tree)
{
  std::vector<TypeReference> out;
  TypeReferenceCollector collector(out);
  collector.walk(tree.root());
  return out;
}

std::vector<std::string> collect_name_tokens(const SyntaxTree & tree)
{
  std::vector<std::string> out;
  ts_ll::Cursor cursor(tree.root().raw());
  const std::string_view source = tree.text();

  // Pre-order walk over every node; name-like nodes are leaves for this purpose.
  bool done = false;
  while (!done) {
    const ts_ll::Node node = cursor.current_node();
    const SyntaxKind kind = syntax_kind_from_ts(node.kind());
    const bool is_name = kind == SyntaxKind::Name || kind == SyntaxKind::QualifiedName;
    if (is_name) {
      const std::string n = normalize_name(node.text(source));
      if (!n.empty()) {
        out.emplace_back(short_name(n));
      }
    }

    if (!is_name && cursor.goto_first_child()) {
      continue;
    }
    while (!cursor.goto_next_sibling()) {
      if (!cursor.goto_parent()) {
        done = true;
        break;
      }
    }
  }
  return out;
}

}  // namespace php_refactor
