// php_refactor/refactor/import_block.cpp - Leading `use` block detection and import insertion
#include "php_refactor/refactor/import_block.hpp"

#include <algorithm>
#include <cctype>
#include <set>

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

/// `keyword` followed by whitespace (or end of line), case-insensitive.
bool starts_with_keyword(std::string_view line, std::string_view keyword) noexcept
{
  if (line.size() < keyword.size() || !iequals(line.substr(0, keyword.size()), keyword)) {
    return false;
  }
  return line.size() == keyword.size() ||
         std::isspace(static_cast<unsigned char>(line[keyword.size()]));
}

bool is_declare_line(std::string_view line) noexcept
{
  constexpr std::string_view k_declare = "declare";
  if (line.size() <= k_declare.size() || !iequals(line.substr(0, k_declare.size()), k_declare)) {
    return false;
  }
  const char next = line[k_declare.size()];
  return next == '(' || std::isspace(static_cast<unsigned char>(next));
}

std::string_view drop_keyword(std::string_view line, std::string_view keyword) noexcept
{
  return trim(line.substr(keyword.size()));
}

bool is_namespace_line(std::string_view t) noexcept
{
  if (!starts_with_keyword(t, "namespace")) {
    return false;
  }
  const auto rest = drop_keyword(t, "namespace");
  return !rest.empty() && rest.front() != ';' &&
         rest.find_first_of(";{") != std::string_view::npos;
}

bool is_type_declaration_line(std::string_view t) noexcept
{
  for (;;) {
    if (starts_with_keyword(t, "abstract")) {
      t = drop_keyword(t, "abstract");
    } else if (starts_with_keyword(t, "final")) {
      t = drop_keyword(t, "final");
    } else if (starts_with_keyword(t, "readonly")) {
      t = drop_keyword(t, "readonly");
    } else {
      break;
    }
  }
  return starts_with_keyword(t, "class") || starts_with_keyword(t, "interface") ||
         starts_with_keyword(t, "trait") || starts_with_keyword(t, "enum");
}

std::string strip_alias(std::string_view item)
{
  item = trim(item);
  const auto ws = std::find_if(item.begin(), item.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
  return normalize_name(item.substr(0, static_cast<size_t>(ws - item.begin())));
}

std::vector<std::string_view> split_items(std::string_view list)
{
  std::vector<std::string_view> out;
  size_t start = 0;
  while (start <= list.size()) {
    const size_t comma = list.find(',', start);
    const auto part = trim(list.substr(start, comma == std::string_view::npos ? list.npos : comma - start));
    if (!part.empty()) {
      out.push_back(part);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return out;
}

std::string join_lines(const std::vector<std::string> & lines)
{
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

}  // namespace

// ============================================================================
// Statement parsing
// ============================================================================

std::vector<std::string> expand_use_statement(std::string_view statement)
{
  auto body = trim(statement);
  if (starts_with_keyword(body, "use")) {
    body = drop_keyword(body, "use");
  }
  if (!body.empty() && body.back() == ';') {
    body.remove_suffix(1);
  }
  body = trim(body);
  if (starts_with_keyword(body, "function") || starts_with_keyword(body, "const")) {
    return {};
  }

  std::vector<std::string> out;
  const size_t open = body.find('{');
  if (open == std::string_view::npos) {
    for (const auto item : split_items(body)) {
      auto fqn = strip_alias(item);
      if (!fqn.empty()) {
        out.push_back(std::move(fqn));
      }
    }
    return out;
  }

  auto prefix = trim(body.substr(0, open));
  while (!prefix.empty() && prefix.back() == k_ns_separator) {
    prefix.remove_suffix(1);
  }
  const size_t close = body.find('}', open);
  const auto inner =
    body.substr(open + 1, close == std::string_view::npos ? body.npos : close - open - 1);
  for (const auto item : split_items(inner)) {
    if (starts_with_keyword(item, "function") || starts_with_keyword(item, "const")) {
      continue;
    }
    const auto member = strip_alias(item);
    if (!member.empty()) {
      out.push_back(normalize_name(join_fqn(prefix, member)));
    }
  }
  return out;
}

bool import_text_less(std::string_view a, std::string_view b)
{
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    const int ca = std::tolower(static_cast<unsigned char>(a[i]));
    const int cb = std::tolower(static_cast<unsigned char>(b[i]));
    if (ca != cb) {
      return ca < cb;
    }
  }
  if (a.size() != b.size()) {
    return a.size() < b.size();
  }
  return a < b;
}

// ============================================================================
// Block detection
// ============================================================================

bool ImportBlock::contains_fqn(std::string_view fqn) const
{
  const std::string wanted = normalize_name(fqn);
  for (const auto & stmt : statements) {
    for (const auto & have : stmt.fqns) {
      if (iequals(have, wanted)) {
        return true;
      }
    }
  }
  return false;
}

ImportBlock find_import_block(const SourceFile & file)
{
  ImportBlock block;
  const auto line_count = static_cast<uint32_t>(file.line_count());

  for (uint32_t i = 0; i < line_count; ++i) {
    const auto t = trim(file.get_line(i));

    if (!block.open_tag_line && t.substr(0, 5) == "<?php") {
      block.open_tag_line = i;
      continue;
    }
    if (is_type_declaration_line(t)) {
      break;
    }
    if (!block.namespace_line && block.statements.empty() && is_namespace_line(t)) {
      block.namespace_line = i;
      continue;
    }
    if (!block.namespace_line && !block.declare_line && block.statements.empty() && is_declare_line(t)) {
      block.declare_line = i;
      continue;
    }

    if (starts_with_keyword(t, "use")) {
      // A group statement may span lines; gather through the terminating ';'.
      std::vector<std::string> parts{std::string(t)};
      uint32_t last = i;
      while (parts.back().find(';') == std::string::npos && last + 1 < line_count) {
        ++last;
        parts.emplace_back(file.get_line(last));
      }
      if (parts.back().find(';') == std::string::npos) {
        break;
      }

      ImportStatement stmt;
      std::string joined = join_lines(parts);
      joined = "use " + std::string(trim(std::string_view(joined).substr(3)));
      const size_t semi = joined.rfind(';');
      joined.resize(semi + 1);
      stmt.fqns = expand_use_statement(joined);
      stmt.text = std::move(joined);
      stmt.first_line = i;
      stmt.last_line = last;
      block.statements.push_back(std::move(stmt));
      i = last;
      continue;
    }

    if (t.empty()) {
      continue;
    }
    if (!block.statements.empty()) {
      break;
    }
  }

  if (!block.statements.empty()) {
    const uint32_t first = block.statements.front().first_line;
    const uint32_t last = block.statements.back().last_line;
    const uint32_t end =
      file.get_line_offset(last) + static_cast<uint32_t>(file.get_line(last).size());
    block.range = SourceRange(file.get_line_offset(first), end);
  }

  if (block.namespace_line) {
    block.insert_line = *block.namespace_line + 1;
  } else if (block.declare_line) {
    block.insert_line = *block.declare_line + 1;
  } else if (block.open_tag_line) {
    block.insert_line = *block.open_tag_line + 1;
  }
  return block;
}

// ============================================================================
// Import insertion
// ============================================================================

std::optional<EditOperation> plan_import_edit(
  const SourceFile & file, const std::vector<std::string> & fqns)
{
  const ImportBlock block = find_import_block(file);

  std::vector<std::string> added;
  for (const auto & raw : fqns) {
    std::string fqn = normalize_name(raw);
    if (fqn.empty() || block.contains_fqn(fqn)) {
      continue;
    }
    const bool dup = std::any_of(
      added.begin(), added.end(), [&](const std::string & a) { return iequals(a, fqn); });
    if (!dup) {
      added.push_back(std::move(fqn));
    }
  }
  if (added.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> lines;
  for (const auto & stmt : block.statements) {
    lines.push_back(stmt.text);
  }
  for (const auto & fqn : added) {
    lines.push_back("use " + fqn + ";");
  }
  std::sort(lines.begin(), lines.end(), [](const std::string & a, const std::string & b) {
    return import_text_less(a, b);
  });
  lines.erase(std::unique(lines.begin(), lines.end()), lines.end());

  EditOperation op;
  op.target_file = file.path();

  if (block.range) {
    op.range = file.get_full_range(*block.range);
    op.replacement_text = join_lines(lines);
    return op;
  }

  const auto line_count = static_cast<uint32_t>(file.line_count());
  const bool at_eof = block.insert_line >= line_count;
  const uint32_t offset =
    at_eof ? static_cast<uint32_t>(file.size()) : file.get_line_offset(block.insert_line);

  const bool prev_blank =
    block.insert_line == 0 || trim(file.get_line(block.insert_line - 1)).empty();
  const bool next_blank = at_eof || trim(file.get_line(block.insert_line)).empty();

  std::string text;
  if (at_eof && !file.content().empty() && file.content().back() != '\n') {
    text += '\n';
  }
  if (!prev_blank) {
    text += '\n';
  }
  text += join_lines(lines);
  text += next_blank ? "\n" : "\n\n";

  op.range = file.get_full_range(SourceRange(offset, offset));
  op.replacement_text = std::move(text);
  return op;
}

}  // namespace php_refactor
