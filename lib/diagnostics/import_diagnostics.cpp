// php_refactor/diagnostics/import_diagnostics.cpp - Missing-import detection
#include "php_refactor/diagnostics/import_diagnostics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <regex>

#include "php_refactor/refactor/import_block.hpp"
#include "php_refactor/syntax/php_queries.hpp"

namespace php_refactor
{

std::string missing_import_message(std::string_view class_name)
{
  return fmt::format("Class '{}' is not imported. Add 'use' statement.", class_name);
}

std::optional<std::string> class_name_from_message(std::string_view message)
{
  static const std::regex k_quoted(R"(Class '([\w\\]+)')");
  static const std::regex k_not_found(R"(Class ([\w\\]+) not found)");
  static const std::regex k_unknown(R"(unknown class ([\w\\]+))", std::regex::icase);

  const std::string text(message);
  std::smatch m;
  for (const std::regex * re : {&k_quoted, &k_not_found, &k_unknown}) {
    if (std::regex_search(text, m, *re)) {
      return m[1].str();
    }
  }
  return std::nullopt;
}

size_t check_missing_imports(const SyntaxTree & tree, const SymbolIndex & index, DiagnosticBag & diags)
{
  const auto ns_info = find_namespace(tree);
  const std::string ns = ns_info ? ns_info->name : std::string();
  const ImportTable imports = collect_imports(tree);

  std::vector<std::string> local_types;
  for (const auto & decl : find_type_declarations(tree)) {
    if (iequals(decl.namespace_name, ns)) {
      local_types.push_back(decl.name);
    }
  }

  size_t reported = 0;
  for (const auto & ref : collect_type_references(tree)) {
    if (ref.fully_qualified || ref.is_qualified()) {
      continue;
    }
    const std::string & name = ref.written;
    if (is_builtin_type_name(name) || is_relative_scope_name(name)) {
      continue;
    }
    if (imports.find_alias(name) != nullptr) {
      continue;
    }
    const bool local = std::any_of(local_types.begin(), local_types.end(), [&](const std::string & t) {
      return iequals(t, name);
    });
    if (local) {
      continue;
    }

    const auto defs = index.lookup_definitions(name);
    const std::string same_ns_fqn = join_fqn(ns, name);
    const bool same_namespace = std::any_of(defs.begin(), defs.end(), [&](const SymbolDefinition & d) {
      return iequals(d.fqn, same_ns_fqn);
    });
    if (same_namespace) {
      continue;
    }

    auto builder = diags.report_error(ref.range, missing_import_message(name), "not imported");
    builder.with_code(k_missing_import_code).with_source(k_diagnostic_source);

    std::vector<std::string> offered;
    for (const auto & def : defs) {
      if (def.fqn.empty() || std::find(offered.begin(), offered.end(), def.fqn) != offered.end()) {
        continue;
      }
      offered.push_back(def.fqn);
      if (const auto op = plan_import_edit(tree.file(), {def.fqn})) {
        builder.with_fixit(
          op->range.to_source_range(), op->replacement_text, "Add import for " + def.fqn);
      }
    }
    if (offered.empty()) {
      builder.with_help(fmt::format("no definition of '{}' was found in the index", name));
    }
    ++reported;
  }
  return reported;
}

}  // namespace php_refactor
