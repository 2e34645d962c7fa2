// php_refactor/refactor/edit_planner.cpp - Multi-file refactoring edit computation
#include "php_refactor/refactor/edit_planner.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

#include "php_refactor/basic/logging.hpp"
#include "php_refactor/refactor/import_block.hpp"
#include "php_refactor/syntax/php_queries.hpp"

namespace php_refactor
{

namespace
{

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

bool icontains(std::string_view haystack, std::string_view needle)
{
  if (needle.empty()) {
    return true;
  }
  const auto it = std::search(
    haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
  return it != haystack.end();
}

bool istarts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

/// Whole lines covered by `range`, including the trailing newline.
SourceRange whole_lines(const SourceFile & file, SourceRange range)
{
  const LineColumn start = file.get_line_column(range.get_begin().offset());
  const LineColumn end = file.get_line_column(range.get_end().offset());
  const uint32_t begin_offset = file.get_line_offset(start.line - 1);
  const uint32_t end_offset = end.line < file.line_count()
                                ? file.get_line_offset(end.line)
                                : static_cast<uint32_t>(file.size());
  return {begin_offset, end_offset};
}

EditOperation make_edit(const fs::path & path, const SourceFile & file, SourceRange range, std::string text)
{
  return EditOperation{path, file.get_full_range(range), std::move(text)};
}

bool is_unqualified_use_of(const TypeReference & ref, std::string_view type_name)
{
  return !ref.fully_qualified && !ref.is_qualified() && iequals(ref.written, type_name);
}

}  // namespace

bool is_valid_identifier(std::string_view name) noexcept
{
  if (name.empty()) {
    return false;
  }
  const auto head = static_cast<unsigned char>(name.front());
  if (!(std::isalpha(head) || head == '_' || head >= 0x80)) {
    return false;
  }
  return std::all_of(name.begin() + 1, name.end(), [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u == '_' || u >= 0x80;
  });
}

// ============================================================================
// EditPlanner
// ============================================================================

struct EditPlanner::MoveContext
{
  fs::path old_path;
  fs::path new_path;
  fs::path moved_path;  ///< where the moved file's content was read from

  std::string old_namespace;
  std::string new_namespace;
  bool namespace_changed = false;

  std::string old_type_name;
  std::string new_type_name;

  [[nodiscard]] std::string old_fqn() const { return join_fqn(old_namespace, old_type_name); }
  [[nodiscard]] std::string new_fqn() const { return join_fqn(new_namespace, new_type_name); }
  [[nodiscard]] bool type_renamed() const { return old_type_name != new_type_name; }
};

EditPlanner::EditPlanner(
  const SymbolIndex & index, const NamespaceResolver & resolver, const SourceRegistry * documents,
  std::shared_ptr<spdlog::logger> logger)
: index_(index),
  resolver_(resolver),
  documents_(documents),
  logger_(logger_or_default(std::move(logger)))
{
}

std::optional<std::string> EditPlanner::read(const fs::path & path) const
{
  if (documents_ != nullptr) {
    return documents_->read(path);
  }
  return read_file_to_string(path);
}

std::vector<fs::path> EditPlanner::candidate_files() const
{
  return candidates_ ? *candidates_ : index_.indexed_files();
}

bool EditPlanner::is_interface(std::string_view type_fqn) const
{
  for (const auto & def : index_.lookup_definitions(short_name(type_fqn))) {
    if (iequals(def.fqn, type_fqn) || namespace_part(type_fqn).empty()) {
      return def.kind == SymbolKind::Interface;
    }
  }
  return false;
}

std::vector<std::string> EditPlanner::implementor_fqns(std::string_view interface_fqn) const
{
  const std::string_view wanted = short_name(interface_fqn);
  std::set<std::string> out;
  for (const auto & name : index_.implementations_of(interface_fqn)) {
    for (const auto & edge : index_.inheritance_of(name)) {
      for (const auto & impl : edge.implements_names) {
        const std::string normalized = normalize_name(impl);
        if (iequals(short_name(normalized), wanted)) {
          out.insert(edge.class_fqn);
        }
      }
    }
  }
  return {out.begin(), out.end()};
}

// ============================================================================
// Method rename
// ============================================================================

std::optional<RenameTarget> EditPlanner::identify_rename_target(
  const SyntaxTree & tree, std::string_view method, std::optional<uint32_t> cursor,
  std::string * error) const
{
  const auto decls = find_type_declarations(tree);

  const auto declared_method = [&](const TypeDeclaration & decl) -> SyntaxNode {
    const SyntaxNode body = decl.node.field("body");
    for (const SyntaxNode & member : body.named_children()) {
      if (member.kind() == SyntaxKind::MethodDeclaration && iequals(member.name_text(), method)) {
        return member;
      }
    }
    return {};
  };

  const auto make_target = [&](std::string fqn, bool interface_target) {
    RenameTarget target;
    target.method = std::string(method);
    target.is_interface = interface_target;
    if (interface_target) {
      target.implementor_fqns = implementor_fqns(fqn);
    }
    target.class_fqn = std::move(fqn);
    return target;
  };

  if (cursor) {
    const SourceLocation loc(*cursor);

    // The cursor sits inside a declaration of the method.
    const TypeDeclaration * best = nullptr;
    for (const auto & decl : decls) {
      const SyntaxNode m = declared_method(decl);
      if (m.is_null() || !m.range().touches(loc)) {
        continue;
      }
      if (best == nullptr || decl.range.size() < best->range.size()) {
        best = &decl;
      }
    }
    if (best != nullptr) {
      return make_target(best->fqn(), best->kind == SyntaxKind::InterfaceDeclaration);
    }

    // The cursor sits on a call whose receiver resolves.
    ScopeTracker finder(tree, RenameTarget{{}, std::string(method), false, {}});
    finder.run();
    for (const auto & site : finder.call_sites()) {
      if (site.name_range.touches(loc) && !site.receiver_type.empty()) {
        return make_target(site.receiver_type, is_interface(site.receiver_type));
      }
    }

    const auto enclosing = enclosing_type_at(tree, *cursor);
    if (enclosing && !declared_method(*enclosing).is_null()) {
      return make_target(enclosing->fqn(), enclosing->kind == SyntaxKind::InterfaceDeclaration);
    }
    if (error != nullptr) {
      *error = fmt::format(
        "no target identified: no class, interface or trait declaring '{}' at the cursor", method);
    }
    return std::nullopt;
  }

  for (const auto & decl : decls) {
    if (!declared_method(decl).is_null()) {
      return make_target(decl.fqn(), decl.kind == SyntaxKind::InterfaceDeclaration);
    }
  }
  for (const auto & decl : decls) {
    if (decl.kind != SyntaxKind::EnumDeclaration) {
      return make_target(decl.fqn(), decl.kind == SyntaxKind::InterfaceDeclaration);
    }
  }
  if (error != nullptr) {
    *error = fmt::format(
      "no target identified: {} declares no class, interface or trait", tree.path().string());
  }
  return std::nullopt;
}

RefactorResult EditPlanner::rename_method(
  const fs::path & file, std::string_view old_name, std::string_view new_name,
  std::optional<uint32_t> cursor) const
{
  const std::string to = std::string(trim(new_name));
  const std::string from = std::string(trim(old_name));
  if (to.empty()) {
    return RefactorResult::fail("new method name must not be empty");
  }
  if (!is_valid_identifier(to)) {
    return RefactorResult::fail(fmt::format("'{}' is not a valid method name", to));
  }
  if (!is_valid_identifier(from)) {
    return RefactorResult::fail(fmt::format("'{}' is not a valid method name", from));
  }

  auto text = read(file);
  if (!text) {
    return RefactorResult::fail(fmt::format("cannot read {}", file.string()));
  }
  const auto tree = parse_php(file, std::move(*text));
  if (!tree) {
    return RefactorResult::fail(fmt::format("cannot parse {}", file.string()));
  }

  std::string error;
  const auto target = identify_rename_target(*tree, from, cursor, &error);
  if (!target) {
    return RefactorResult::fail(error);
  }
  if (from == to) {
    return RefactorResult::ok({});
  }
  logger_->debug(
    "renaming {}::{} to {} ({} implementor(s))", target->class_fqn, from, to,
    target->implementor_fqns.size());

  // Declaring files first, then every candidate that mentions the method.
  std::vector<fs::path> files;
  std::set<std::string> seen;
  const auto add_file = [&](const fs::path & p) {
    if (seen.insert(SourceRegistry::normalize_key(p)).second) {
      files.push_back(p);
    }
  };
  add_file(file);
  for (const auto & def : index_.lookup_method(target->class_fqn, from)) {
    add_file(def.path);
  }
  for (const auto & impl : target->implementor_fqns) {
    for (const auto & def : index_.lookup_method(impl, from)) {
      add_file(def.path);
    }
  }
  for (const auto & p : candidate_files()) {
    add_file(p);
  }

  const std::string arrow = "->" + from;
  const std::string scope = "::" + from;
  const std::string decl = "function " + from;

  EditSet edits(logger_);
  std::vector<std::string> warnings;
  for (const auto & path : files) {
    auto content = read(path);
    if (!content) {
      warnings.push_back(fmt::format("skipped {}: cannot read file", path.string()));
      continue;
    }
    if (!icontains(*content, arrow) && !icontains(*content, scope) && !icontains(*content, decl)) {
      continue;
    }
    const auto candidate = parse_php(path, std::move(*content));
    if (!candidate) {
      logger_->warn("skipping {}: parse error", path.string());
      warnings.push_back(fmt::format("skipped {}: parse error", path.string()));
      continue;
    }

    ScopeTracker tracker(*candidate, *target);
    tracker.run();
    for (const auto & range : tracker.definitions()) {
      edits.add(EditOperation{path, candidate->full_range(range), to});
    }
    for (const auto & site : tracker.call_sites()) {
      if (site.accepted) {
        edits.add(EditOperation{path, candidate->full_range(site.name_range), to});
      }
    }
  }

  logger_->info(
    "rename {}::{} -> {}: {} edit(s) in {} file(s)", target->class_fqn, from, to, edits.size(),
    edits.files().size());
  auto result = RefactorResult::ok(edits.operations());
  result.warnings = std::move(warnings);
  return result;
}

// ============================================================================
// File move
// ============================================================================

void EditPlanner::plan_moved_file(MoveContext & ctx, const SyntaxTree & tree, EditSet & edits) const
{
  const SourceFile & file = tree.file();
  const auto ns = find_namespace(tree);

  if (ctx.namespace_changed) {
    if (ns && ns->braced) {
      edits.add(make_edit(ctx.moved_path, file, ns->name_range, ctx.new_namespace));
    } else if (ns) {
      edits.add(make_edit(
        ctx.moved_path, file, ns->declaration_range, "namespace " + ctx.new_namespace + ";"));
    } else {
      const ImportBlock block = find_import_block(file);
      if (block.open_tag_line) {
        // `declare(strict_types=1)` must stay the first statement.
        const uint32_t line = block.declare_line.value_or(*block.open_tag_line);
        const uint32_t offset =
          file.get_line_offset(line) + static_cast<uint32_t>(file.get_line(line).size());
        std::string text = "\n\nnamespace " + ctx.new_namespace + ";";
        if (line + 1 < file.line_count() && !trim(file.get_line(line + 1)).empty()) {
          text += "\n";
        }
        edits.add(make_edit(ctx.moved_path, file, SourceRange(offset, offset), std::move(text)));
      } else {
        edits.add(make_edit(
          ctx.moved_path, file, SourceRange(0, 0),
          "<?php\n\nnamespace " + ctx.new_namespace + ";\n\n"));
      }
    }
  }

  const auto refs = collect_type_references(tree);

  if (ctx.type_renamed()) {
    if (const auto primary = primary_type(tree)) {
      edits.add(make_edit(ctx.moved_path, file, primary->name_range, ctx.new_type_name));
    }
    for (const auto & ref : refs) {
      if (is_unqualified_use_of(ref, ctx.old_type_name)) {
        edits.add(make_edit(ctx.moved_path, file, ref.range, ctx.new_type_name));
      }
    }
  }

  if (!ctx.namespace_changed) {
    return;
  }

  // Types the file used implicitly from its old namespace now need imports.
  const ImportTable imports = collect_imports(tree);
  std::set<std::string> declared;
  for (const auto & decl : find_type_declarations(tree)) {
    declared.insert(decl.name);
  }

  std::vector<std::string> needed;
  for (const auto & ref : refs) {
    if (ref.fully_qualified || ref.is_qualified() || is_builtin_type_name(ref.written) ||
        is_relative_scope_name(ref.written) || imports.find_alias(ref.written) != nullptr ||
        declared.count(ref.written) > 0 || iequals(ref.written, ctx.old_type_name)) {
      continue;
    }
    const std::string fqn = join_fqn(ctx.old_namespace, ref.written);
    const auto defs = index_.lookup_definitions(ref.written);
    const bool defined = std::any_of(defs.begin(), defs.end(), [&](const SymbolDefinition & d) {
      return iequals(d.fqn, fqn);
    });
    if (defined && std::find(needed.begin(), needed.end(), fqn) == needed.end()) {
      needed.push_back(fqn);
    }
  }
  if (auto op = plan_import_edit(file, needed)) {
    op->target_file = ctx.moved_path;
    edits.add(std::move(*op));
  }
}

void EditPlanner::plan_referencing_file(
  MoveContext & ctx, const SyntaxTree & tree, EditSet & edits,
  std::vector<std::string> & warnings) const
{
  const SourceFile & file = tree.file();
  const fs::path & path = tree.path();
  const auto ns_info = find_namespace(tree);
  const std::string ns = ns_info ? ns_info->name : std::string();
  const ImportTable imports = collect_imports(tree);
  const auto refs = collect_type_references(tree);

  const std::string old_fqn = ctx.old_fqn();
  const std::string new_fqn = ctx.new_fqn();

  const auto rename_short_uses = [&]() {
    for (const auto & ref : refs) {
      if (is_unqualified_use_of(ref, ctx.old_type_name)) {
        edits.add(make_edit(path, file, ref.range, ctx.new_type_name));
      }
    }
  };

  if (const UseItem * item = imports.find_fqn(old_fqn)) {
    const bool lands_here = iequals(namespace_part(new_fqn), ns);
    const bool sole_import = !item->in_group && item->declaration_item_count == 1;
    const bool alias_survives = !item->explicit_alias || iequals(item->alias, ctx.new_type_name);

    if (lands_here && sole_import && alias_survives) {
      edits.add(make_edit(path, file, whole_lines(file, item->declaration_range), ""));
    } else if (item->in_group) {
      const std::string prefix = item->group_prefix + k_ns_separator;
      if (istarts_with(new_fqn, prefix)) {
        edits.add(make_edit(path, file, item->name_range, new_fqn.substr(prefix.size())));
      } else {
        warnings.push_back(fmt::format(
          "{}: group import of {} left unchanged ({} is outside '{}')", path.string(), old_fqn,
          new_fqn, item->group_prefix));
      }
    } else {
      const bool rooted = file.get_slice(item->name_range).substr(0, 1) == "\\";
      edits.add(make_edit(path, file, item->name_range, (rooted ? "\\" : "") + new_fqn));
    }

    if (ctx.type_renamed() && !item->explicit_alias) {
      rename_short_uses();
    }
    return;
  }

  for (const auto & ref : refs) {
    if (!ref.fully_qualified && !ref.is_qualified()) {
      continue;
    }
    const std::string written = ref.fully_qualified ? "\\" + ref.written : ref.written;
    if (iequals(resolve_class_name(written, imports, ns), old_fqn)) {
      edits.add(make_edit(path, file, ref.range, "\\" + new_fqn));
    }
  }

  // Same namespace as the old location: the type was visible without an import.
  if (!iequals(ns, ctx.old_namespace) || imports.find_alias(ctx.old_type_name) != nullptr) {
    return;
  }
  const bool uses_short_name = std::any_of(refs.begin(), refs.end(), [&](const TypeReference & ref) {
    return is_unqualified_use_of(ref, ctx.old_type_name);
  });
  if (!uses_short_name) {
    return;
  }
  if (!iequals(ns, ctx.new_namespace)) {
    if (auto op = plan_import_edit(file, {new_fqn})) {
      op->target_file = path;
      edits.add(std::move(*op));
    }
  }
  if (ctx.type_renamed()) {
    rename_short_uses();
  }
}

RefactorResult EditPlanner::move_file(const fs::path & old_path, const fs::path & new_path) const
{
  if (old_path.extension() != ".php" || new_path.extension() != ".php") {
    auto result = RefactorResult::ok({});
    result.warnings.push_back(
      fmt::format("{} is not a PHP source file; nothing to do", new_path.string()));
    return result;
  }

  MoveContext ctx;
  ctx.old_path = old_path;
  ctx.new_path = new_path;

  std::optional<std::string> content = read(new_path);
  ctx.moved_path = new_path;
  if (!content) {
    content = read(old_path);
    ctx.moved_path = old_path;
  }
  if (!content) {
    return RefactorResult::fail(fmt::format("cannot read {}", new_path.string()));
  }

  const auto old_ns = resolver_.resolve(old_path);
  const auto new_ns = resolver_.resolve(new_path);
  ctx.namespace_changed = old_ns && new_ns && *old_ns != *new_ns;

  std::vector<std::string> warnings;
  EditSet edits(logger_);

  const std::string original = *content;
  const auto tree = parse_php(ctx.moved_path, std::move(*content));
  if (!tree) {
    // Only the namespace line can be fixed without a tree.
    logger_->warn("{} does not parse; updating its namespace declaration only", ctx.moved_path.string());
    warnings.push_back(fmt::format(
      "{}: parse error, only the namespace declaration was updated", ctx.moved_path.string()));
    if (ctx.namespace_changed) {
      static const std::regex k_namespace_decl(R"(namespace\s+([^;{]+);)");
      std::smatch m;
      if (std::regex_search(original, m, k_namespace_decl)) {
        const SourceFile file(ctx.moved_path, original);
        const auto begin = static_cast<uint32_t>(m.position(0));
        const auto end = static_cast<uint32_t>(m.position(0) + m.length(0));
        edits.add(make_edit(
          ctx.moved_path, file, SourceRange(begin, end), "namespace " + *new_ns + ";"));
      }
    }
    auto result = RefactorResult::ok(edits.operations());
    result.warnings = std::move(warnings);
    return result;
  }

  const auto ns_info = find_namespace(*tree);
  ctx.old_namespace = ns_info ? ns_info->name : old_ns.value_or(std::string());
  ctx.new_namespace = ctx.namespace_changed ? *new_ns : ctx.old_namespace;

  const auto primary = primary_type(*tree);
  if (primary) {
    ctx.old_type_name = primary->name;
    ctx.new_type_name = primary->name;
    const std::string old_stem = old_path.stem().string();
    const std::string new_stem = new_path.stem().string();
    if (primary->name == old_stem && new_stem != old_stem && is_valid_identifier(new_stem)) {
      ctx.new_type_name = new_stem;
    }
  }

  plan_moved_file(ctx, *tree, edits);

  if (primary && ctx.old_fqn() != ctx.new_fqn()) {
    const std::set<std::string> skip = {
      SourceRegistry::normalize_key(old_path), SourceRegistry::normalize_key(new_path)};
    for (const auto & path : candidate_files()) {
      if (skip.count(SourceRegistry::normalize_key(path)) > 0) {
        continue;
      }
      auto text = read(path);
      if (!text) {
        warnings.push_back(fmt::format("skipped {}: cannot read file", path.string()));
        continue;
      }
      if (!icontains(*text, ctx.old_type_name)) {
        continue;
      }
      const auto other = parse_php(path, std::move(*text));
      if (!other) {
        logger_->warn("skipping {}: parse error", path.string());
        warnings.push_back(fmt::format("skipped {}: parse error", path.string()));
        continue;
      }
      plan_referencing_file(ctx, *other, edits, warnings);
    }
  }

  logger_->info(
    "move {} -> {}: {} edit(s) in {} file(s)", old_path.string(), new_path.string(), edits.size(),
    edits.files().size());
  auto result = RefactorResult::ok(edits.operations());
  result.warnings = std::move(warnings);
  return result;
}

// ============================================================================
// Import insertion
// ============================================================================

RefactorResult EditPlanner::add_imports(
  const fs::path & file, const std::vector<std::string> & fqns) const
{
  auto content = read(file);
  if (!content) {
    return RefactorResult::fail(fmt::format("cannot read {}", file.string()));
  }
  const SourceFile source(file, std::move(*content));
  std::vector<EditOperation> ops;
  if (auto op = plan_import_edit(source, fqns)) {
    ops.push_back(std::move(*op));
  }
  return RefactorResult::ok(std::move(ops));
}

}  // namespace php_refactor
