// php_refactor/refactor/doc_block.cpp - PHPDoc generation for classes and functions
#include "php_refactor/refactor/doc_block.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "php_refactor/syntax/syntax_walker.hpp"

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

bool starts_with(std::string_view s, std::string_view prefix) noexcept
{
  return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// Comment text of one line: `/**`, `*/` and the leading `*` removed.
std::string_view strip_comment_markers(std::string_view line) noexcept
{
  std::string_view t = trim(line);
  if (starts_with(t, "/**")) {
    t.remove_prefix(3);
  } else if (starts_with(t, "/*")) {
    t.remove_prefix(2);
  }
  if (ends_with(t, "*/")) {
    t.remove_suffix(2);
  }
  t = trim(t);
  if (starts_with(t, "*")) {
    t.remove_prefix(1);
  }
  return trim(t);
}

std::string_view next_token(std::string_view & s) noexcept
{
  s = trim(s);
  size_t n = 0;
  while (n < s.size() && !std::isspace(static_cast<unsigned char>(s[n]))) {
    ++n;
  }
  const std::string_view token = s.substr(0, n);
  s.remove_prefix(n);
  s = trim(s);
  return token;
}

/// `$name`, `&$name` or `...$name` -> `name`
std::string_view bare_variable(std::string_view v) noexcept
{
  while (!v.empty() && (v.front() == '&' || v.front() == '.' || v.front() == '$')) {
    v.remove_prefix(1);
  }
  return v;
}

bool is_variable_token(std::string_view t) noexcept
{
  return starts_with(t, "$") || starts_with(t, "...$") || starts_with(t, "&$");
}

std::string_view indentation_of(std::string_view line) noexcept
{
  size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    ++n;
  }
  return line.substr(0, n);
}

/// The `/** ... */` block ending directly above `decl_line` (0-indexed), blank lines skipped.
std::optional<SourceRange> existing_block(const SourceFile & file, uint32_t decl_line)
{
  int64_t end = static_cast<int64_t>(decl_line) - 1;
  while (end >= 0 && trim(file.get_line(static_cast<uint32_t>(end))).empty()) {
    --end;
  }
  if (end < 0) {
    return std::nullopt;
  }
  const auto end_line = static_cast<uint32_t>(end);
  if (!ends_with(trim(file.get_line(end_line)), "*/")) {
    return std::nullopt;
  }

  for (int64_t i = end; i >= 0; --i) {
    const auto line = static_cast<uint32_t>(i);
    const std::string_view t = trim(file.get_line(line));
    if (starts_with(t, "/**")) {
      return SourceRange(
        file.get_line_offset(line),
        file.get_line_offset(end_line) + static_cast<uint32_t>(file.get_line(end_line).size()));
    }
    // A plain comment, or the end of an earlier one.
    if (starts_with(t, "/*") || (i != end && ends_with(t, "*/"))) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::string type_text(SyntaxNode type)
{
  std::string_view t = trim(type.text());
  if (starts_with(t, ":")) {
    t = trim(t.substr(1));
  }
  return std::string(t);
}

std::vector<std::string> function_doc_lines(SyntaxNode node, const DocComment & doc)
{
  std::vector<std::string> lines;
  if (doc.description.empty()) {
    lines.emplace_back(" * [Description]");
  }
  for (const auto & d : doc.description) {
    lines.push_back(" * " + d);
  }
  lines.emplace_back(" *");

  for (const SyntaxNode & p : node.field("parameters").named_children()) {
    if (p.kind() != SyntaxKind::SimpleParameter && p.kind() != SyntaxKind::PromotedParameter) {
      continue;
    }
    const std::string name(bare_variable(p.field("name").text()));
    const DocComment::Param * known = doc.param(name);

    std::string type = type_text(p.field("type"));
    if (type.empty()) {
      // An untyped parameter keeps what the block said about it.
      type = (known != nullptr && !known->type.empty()) ? known->type : "mixed";
    }
    const char * variadic = p.ts_kind() == "variadic_parameter" ? "..." : "";
    std::string line = fmt::format(" * @param {} {}${}", type, variadic, name);
    if (known != nullptr && !known->description.empty()) {
      line += " " + known->description;
    }
    lines.push_back(std::move(line));
  }

  const std::string return_tag = doc.return_tag.value_or("");
  std::string_view doc_return = return_tag;
  const std::string_view doc_return_type = next_token(doc_return);
  std::string return_type = type_text(node.field("return_type"));
  if (return_type.empty()) {
    return_type = doc_return_type.empty() ? "void" : std::string(doc_return_type);
  }
  std::string line = " * @return " + return_type;
  if (!doc_return.empty()) {
    line += " " + std::string(doc_return);
  }
  lines.push_back(std::move(line));

  for (const auto & tag : doc.other_tags) {
    lines.push_back(" * " + tag);
  }
  return lines;
}

std::vector<std::string> class_doc_lines(
  SyntaxNode node, const DocComment & doc, std::string_view namespace_name)
{
  const std::string heading = fmt::format("Class {}", node.name_text());

  std::vector<std::string> lines;
  lines.push_back(" * " + heading);
  for (const auto & d : doc.description) {
    if (!starts_with(d, heading)) {
      lines.push_back(" * " + d);
    }
  }

  const bool has_package = std::any_of(
    doc.other_tags.begin(), doc.other_tags.end(),
    [](const std::string & tag) { return starts_with(tag, "@package"); });
  if (!has_package && !namespace_name.empty()) {
    lines.push_back(fmt::format(" * @package {}", namespace_name));
  }
  for (const auto & tag : doc.other_tags) {
    lines.push_back(" * " + tag);
  }
  return lines;
}

/// Declarations a PHPDoc action applies to at one cursor line.
class DocTargetCollector : public SyntaxWalker<DocTargetCollector>
{
public:
  DocTargetCollector(const SourceFile & file, uint32_t cursor_line)
  : file_(file), cursor_line_(cursor_line)
  {
  }

  bool visit_namespace_definition(SyntaxNode node)
  {
    if (namespace_name.empty()) {
      namespace_name = std::string(node.field("name").text());
    }
    return true;
  }

  bool visit_class_declaration(SyntaxNode node)
  {
    if (first_line(node) == cursor_line_) {
      targets.push_back(node);
    }
    return true;
  }

  bool visit_method_declaration(SyntaxNode node) { return visit_function(node); }
  bool visit_function_definition(SyntaxNode node) { return visit_function(node); }

  std::vector<SyntaxNode> targets;
  std::string namespace_name;

private:
  bool visit_function(SyntaxNode node)
  {
    const uint32_t last_line = file_.get_line_column(node.range().get_end().offset()).line;
    if (first_line(node) <= cursor_line_ && cursor_line_ <= last_line) {
      targets.push_back(node);
    }
    return true;
  }

  [[nodiscard]] uint32_t first_line(SyntaxNode node) const
  {
    return file_.get_line_column(node.range().get_begin().offset()).line;
  }

  const SourceFile & file_;
  uint32_t cursor_line_;
};

}  // namespace

const DocComment::Param * DocComment::param(std::string_view name) const
{
  const auto it = std::find_if(
    params.begin(), params.end(), [&](const Param & p) { return p.name == name; });
  return it == params.end() ? nullptr : &*it;
}

DocComment parse_doc_comment(std::string_view text)
{
  DocComment doc;
  while (!text.empty()) {
    const size_t nl = text.find('\n');
    const std::string_view raw = text.substr(0, nl);
    text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

    std::string_view line = strip_comment_markers(raw);
    if (line.empty()) {
      continue;
    }
    if (starts_with(line, "@param")) {
      line.remove_prefix(6);
      DocComment::Param p;
      std::string_view token = next_token(line);
      if (!is_variable_token(token)) {
        p.type = std::string(token);
        token = next_token(line);
      }
      if (!is_variable_token(token)) {
        continue;
      }
      p.name = std::string(bare_variable(token));
      p.description = std::string(line);
      doc.params.push_back(std::move(p));
    } else if (starts_with(line, "@return")) {
      doc.return_tag = std::string(trim(line.substr(7)));
    } else if (starts_with(line, "@")) {
      doc.other_tags.emplace_back(line);
    } else {
      doc.description.emplace_back(line);
    }
  }
  return doc;
}

std::vector<DocBlockAction> plan_doc_block_actions(const SyntaxTree & tree, uint32_t offset)
{
  const SourceFile & file = tree.file();
  offset = std::min(offset, static_cast<uint32_t>(file.size()));

  DocTargetCollector collector(file, file.get_line_column(offset).line);
  collector.walk(tree.root());

  std::vector<DocBlockAction> actions;
  for (const SyntaxNode & node : collector.targets) {
    const uint32_t decl_line = file.get_line_column(node.range().get_begin().offset()).line - 1;
    const std::optional<SourceRange> block = existing_block(file, decl_line);
    const DocComment doc = block ? parse_doc_comment(file.get_slice(*block)) : DocComment{};

    const bool is_class = node.kind() == SyntaxKind::ClassDeclaration;
    std::vector<std::string> body = is_class ? class_doc_lines(node, doc, collector.namespace_name)
                                             : function_doc_lines(node, doc);

    const std::string_view indent = indentation_of(file.get_line(decl_line));
    std::string text = fmt::format("{}/**\n", indent);
    for (const auto & l : body) {
      text += fmt::format("{}{}\n", indent, l);
    }
    text += fmt::format("{} */", indent);

    const char * what = is_class ? "class"
                        : node.kind() == SyntaxKind::MethodDeclaration ? "method"
                                                                       : "function";
    DocBlockAction action;
    action.edit.target_file = tree.path();
    if (block) {
      action.title = fmt::format("Update PHPDoc for {}", what);
      action.edit.range = file.get_full_range(*block);
      action.edit.replacement_text = std::move(text);
    } else {
      const uint32_t at = file.get_line_offset(decl_line);
      action.title = fmt::format("Generate PHPDoc for {}", what);
      action.edit.range = file.get_full_range(SourceRange(at, at));
      action.edit.replacement_text = text + "\n";
    }
    actions.push_back(std::move(action));
  }
  return actions;
}

}  // namespace php_refactor
