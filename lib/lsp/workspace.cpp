#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "php_refactor/analysis/external_analyzer.hpp"
#include "php_refactor/basic/logging.hpp"
#include "php_refactor/diagnostics/import_diagnostics.hpp"
#include "php_refactor/index/symbol_index.hpp"
#include "php_refactor/lsp.hpp"
#include "php_refactor/project/autoload.hpp"
#include "php_refactor/project/file_enumerator.hpp"
#include "php_refactor/project/project_config.hpp"
#include "php_refactor/refactor/doc_block.hpp"
#include "php_refactor/refactor/edit_planner.hpp"
#include "php_refactor/refactor/import_block.hpp"
#include "php_refactor/syntax/php_queries.hpp"

namespace php_refactor::lsp
{
namespace
{

using json = nlohmann::json;
namespace fs = std::filesystem;

// -----------------------------
// URI helpers
// -----------------------------

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

fs::path uri_to_path(std::string_view uri)
{
  constexpr std::string_view file_prefix = "file://";
  if (starts_with(uri, file_prefix)) {
    return fs::path(std::string(uri.substr(file_prefix.size())));
  }
  return fs::path(std::string(uri));
}

std::string path_to_uri(const fs::path & path)
{
  std::error_code ec;
  const fs::path abs = fs::absolute(path, ec);
  return "file://" + (ec ? path : abs).lexically_normal().generic_string();
}

// -----------------------------
// Range helpers
// -----------------------------

json range_to_json(const FullSourceRange & r)
{
  return json{
    {"startByte", r.start_byte},     {"endByte", r.end_byte}, {"startLine", r.start_line},
    {"startColumn", r.start_column}, {"endLine", r.end_line}, {"endColumn", r.end_column},
  };
}

uint32_t clamp_byte_offset(uint32_t off, size_t text_size)
{
  if (off > text_size) {
    return static_cast<uint32_t>(text_size);
  }
  return off;
}

bool is_ident_char(unsigned char c) { return std::isalnum(c) != 0 || c == '_' || c >= 0x80; }

SourceRange word_range_at(std::string_view text, uint32_t byte_offset)
{
  const auto size = static_cast<uint32_t>(text.size());
  byte_offset = clamp_byte_offset(byte_offset, size);
  uint32_t pos = byte_offset;

  if (
    pos > 0 && (pos == size || !is_ident_char(static_cast<unsigned char>(text[pos]))) &&
    is_ident_char(static_cast<unsigned char>(text[pos - 1]))) {
    pos -= 1;
  }
  if (pos >= size || !is_ident_char(static_cast<unsigned char>(text[pos]))) {
    return {byte_offset, byte_offset};
  }

  uint32_t start = pos;
  while (start > 0 && is_ident_char(static_cast<unsigned char>(text[start - 1]))) {
    start -= 1;
  }
  uint32_t end = pos + 1;
  while (end < size && is_ident_char(static_cast<unsigned char>(text[end]))) {
    end += 1;
  }
  return {start, end};
}

std::optional<std::string> word_at(std::string_view text, uint32_t byte_offset)
{
  const auto r = word_range_at(text, byte_offset);
  if (r.is_empty()) {
    return std::nullopt;
  }
  return std::string(text.substr(r.get_begin().offset(), r.size()));
}

/// True when the word starting at `start` follows `->`, `?->` or `::`.
bool is_member_position(std::string_view text, uint32_t start)
{
  const std::string_view before = text.substr(0, start);
  return (before.size() >= 2 && (before.substr(before.size() - 2) == "->" ||
                                 before.substr(before.size() - 2) == "::"));
}

bool looks_like_class_name(std::string_view word)
{
  if (word.empty() || !std::isupper(static_cast<unsigned char>(word.front()))) {
    return false;
  }
  return std::all_of(word.begin(), word.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
  });
}

std::string severity_to_string(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "Error";
    case Severity::Warning:
      return "Warning";
    case Severity::Info:
      return "Info";
    case Severity::Hint:
      return "Hint";
  }
  return "Error";
}

json diagnostic_to_json(const Diagnostic & d, const SourceFile & file)
{
  json item;
  item["source"] = d.source.empty() ? std::string(k_diagnostic_source) : d.source;
  item["message"] = d.message;
  item["severity"] = severity_to_string(d.severity);
  if (!d.code.empty()) {
    item["code"] = d.code;
  }
  item["range"] = range_to_json(file.get_full_range(d.primary_range()));
  item["fixes"] = json::array();
  for (const auto & fix : d.fixits) {
    item["fixes"].push_back(json{
      {"title", fix.title},
      {"range", range_to_json(file.get_full_range(fix.range))},
      {"newText", fix.replacement_text},
    });
  }
  if (d.help_message) {
    item["help"] = *d.help_message;
  }
  return item;
}

json edit_to_json(const EditOperation & op)
{
  return json{
    {"uri", path_to_uri(op.target_file)},
    {"range", range_to_json(op.range)},
    {"newText", op.replacement_text},
  };
}

json refactor_result_to_json(const RefactorResult & r)
{
  json out;
  out["success"] = r.success;
  if (!r.success) {
    out["error"] = r.error;
  }
  out["warnings"] = r.warnings;
  out["edits"] = json::array();
  for (const auto & op : r.edits) {
    out["edits"].push_back(edit_to_json(op));
  }
  return out;
}

json definition_to_json(const SymbolDefinition & def)
{
  return json{
    {"uri", path_to_uri(def.path)},
    {"range", range_to_json(def.name_range)},
    {"name", def.name},
    {"fqn", def.fqn},
    {"kind", to_string(def.kind)},
  };
}

}  // namespace

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  explicit Impl(std::shared_ptr<spdlog::logger> lg)
  : logger(logger_or_default(std::move(lg))), index(logger)
  {
  }

  std::shared_ptr<spdlog::logger> logger;
  ProjectConfig config;
  std::unique_ptr<NamespaceResolver> resolver;
  std::unique_ptr<ExternalAnalyzer> analyzer;
  SymbolIndex index;
  SourceRegistry documents;
  std::vector<fs::path> files;

  /// Read phpref.yaml under `root`; defaults replace an invalid or missing file.
  bool load_config(const fs::path & root, std::string * error = nullptr)
  {
    const fs::path config_path = root / k_project_config_file_name;
    bool ok = true;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
      ConfigLoadResult loaded = load_project_config(config_path);
      if (loaded.success) {
        config = std::move(loaded.config);
      } else {
        logger->warn("{}: {}; using defaults", config_path.string(), loaded.error);
        config = default_project_config(root);
        if (error != nullptr) {
          *error = loaded.error;
        }
        ok = false;
      }
    } else {
      config = default_project_config(root);
    }
    config.project_root = root;
    analyzer.reset();
    return ok;
  }

  NamespaceResolver & ensure_resolver()
  {
    if (!resolver) {
      std::error_code ec;
      fs::path root = config.project_root.empty() ? fs::current_path(ec) : config.project_root;
      resolver = std::make_unique<NamespaceResolver>(std::move(root), logger);
    }
    return *resolver;
  }

  EditPlanner planner()
  {
    EditPlanner p(index, ensure_resolver(), &documents, logger);
    if (!files.empty()) {
      p.set_candidate_files(files);
    }
    return p;
  }

  std::optional<std::string> text_of(const fs::path & path) const { return documents.read(path); }

  std::unique_ptr<SyntaxTree> parse(const fs::path & path, DiagnosticBag * diags = nullptr) const
  {
    auto text = text_of(path);
    if (!text) {
      return nullptr;
    }
    return parse_php(path, std::move(*text), diags);
  }

  void rescan(const fs::path & path)
  {
    if (path.extension() != ".php") {
      return;
    }
    if (auto text = text_of(path)) {
      (void)index.scan_text(path, std::move(*text));
    } else {
      index.remove_file(path);
    }
  }

  void track_file(const fs::path & path)
  {
    const std::string key = SourceRegistry::normalize_key(path);
    const bool known = std::any_of(files.begin(), files.end(), [&](const fs::path & f) {
      return SourceRegistry::normalize_key(f) == key;
    });
    if (!known && path.extension() == ".php") {
      files.push_back(path);
    }
  }

  void untrack_file(const fs::path & path)
  {
    const std::string key = SourceRegistry::normalize_key(path);
    files.erase(
      std::remove_if(
        files.begin(), files.end(),
        [&](const fs::path & f) { return SourceRegistry::normalize_key(f) == key; }),
      files.end());
  }

  // ---------------------------------------------------------------------------

  json index_json()
  {
    const fs::path root = ensure_resolver().project_root();
    files = enumerate_source_files(root, EnumerateOptions::from_config(config.indexer), logger);
    const ScanResult result =
      index.rebuild(files, {}, std::chrono::milliseconds(config.indexer.time_slice_ms));

    const IndexStats stats = index.stats();
    json out;
    out["result"] = to_string(result);
    out["files"] = stats.files;
    out["definitions"] = stats.definitions;
    out["methods"] = stats.methods;
    out["usageSymbols"] = stats.usage_symbols;
    out["inheritance"] = stats.inheritance;
    return out;
  }

  json diagnostics_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const fs::path path = uri_to_path(uri);
    auto text = text_of(path);
    if (!text) {
      return out;
    }
    const SourceFile file(path, *text);

    DiagnosticBag diags;
    const auto tree = parse_php(path, std::move(*text), &diags);
    if (tree) {
      (void)check_missing_imports(*tree, index, diags);
    }
    for (const auto & d : diags) {
      out["items"].push_back(diagnostic_to_json(d, file));
    }
    return out;
  }

  json definition_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const fs::path path = uri_to_path(uri);
    const auto text = text_of(path);
    if (!text) {
      return out;
    }
    byte_offset = clamp_byte_offset(byte_offset, text->size());
    const auto word = word_at(*text, byte_offset);
    if (!word) {
      return out;
    }
    const SourceRange wr = word_range_at(*text, byte_offset);

    if (is_member_position(*text, wr.get_begin().offset())) {
      const std::vector<SymbolDefinition> defs = index.methods_named(*word);
      for (const auto & def : defs) {
        out["locations"].push_back(definition_to_json(def));
      }
      return out;
    }

    for (const auto & def : index.lookup_definitions(*word)) {
      out["locations"].push_back(definition_to_json(def));
    }
    return out;
  }

  json implementation_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const fs::path path = uri_to_path(uri);
    const auto text = text_of(path);
    if (!text) {
      return out;
    }
    std::optional<std::string> name = word_at(*text, clamp_byte_offset(byte_offset, text->size()));
    if (name && index.lookup_definitions(*name).empty()) {
      name.reset();
    }
    if (!name) {
      if (const auto tree = parse(path)) {
        if (const auto enclosing = enclosing_type_at(*tree, byte_offset)) {
          name = enclosing->name;
        }
      }
    }
    if (!name) {
      return out;
    }

    for (const auto & impl : index.implementations_of(*name)) {
      for (const auto & def : index.lookup_definitions(impl)) {
        out["locations"].push_back(definition_to_json(def));
      }
    }
    return out;
  }

  json references_json_impl(std::string_view uri, uint32_t byte_offset)
  {
    json out;
    out["uri"] = std::string(uri);
    out["locations"] = json::array();

    const fs::path path = uri_to_path(uri);
    const auto text = text_of(path);
    if (!text) {
      return out;
    }
    byte_offset = clamp_byte_offset(byte_offset, text->size());
    const auto word = word_at(*text, byte_offset);
    if (!word) {
      return out;
    }
    const bool member = is_member_position(*text, word_range_at(*text, byte_offset).get_begin().offset()) ||
                        !index.methods_named(*word).empty();

    std::vector<fs::path> candidates = index.usage_candidates(*word);
    if (std::none_of(candidates.begin(), candidates.end(), [&](const fs::path & p) {
          return SourceRegistry::normalize_key(p) == SourceRegistry::normalize_key(path);
        })) {
      candidates.push_back(path);
    }

    for (const auto & file_path : candidates) {
      const auto content = text_of(file_path);
      if (!content) {
        continue;
      }
      const SourceFile file(file_path, *content);
      const std::string_view t = file.content();

      size_t pos = t.find(*word);
      while (pos != std::string_view::npos) {
        const size_t end = pos + word->size();
        const bool whole = (pos == 0 || !is_ident_char(static_cast<unsigned char>(t[pos - 1]))) &&
                           (end >= t.size() || !is_ident_char(static_cast<unsigned char>(t[end])));
        bool accept = whole;
        if (whole && member) {
          const bool call_shape = is_member_position(t, static_cast<uint32_t>(pos)) &&
                                  end < t.size() && t[end] == '(';
          const bool decl_shape = pos >= 9 && t.substr(pos - 9, 9) == "function ";
          accept = call_shape || decl_shape;
        }
        if (accept) {
          json loc;
          loc["uri"] = path_to_uri(file_path);
          loc["range"] = range_to_json(
            file.get_full_range(SourceRange(static_cast<uint32_t>(pos), static_cast<uint32_t>(end))));
          out["locations"].push_back(std::move(loc));
        }
        pos = t.find(*word, end);
      }
    }
    return out;
  }

  json code_actions_json_impl(
    std::string_view uri, uint32_t byte_offset, const std::vector<std::string> & messages)
  {
    json out;
    out["uri"] = std::string(uri);
    out["actions"] = json::array();

    const fs::path path = uri_to_path(uri);
    auto text = text_of(path);
    if (!text) {
      return out;
    }
    byte_offset = clamp_byte_offset(byte_offset, text->size());
    const SourceFile file(path, *text);

    std::vector<std::string> names;
    const auto add_name = [&](std::string n) {
      if (std::find(names.begin(), names.end(), n) == names.end()) {
        names.push_back(std::move(n));
      }
    };

    if (!messages.empty()) {
      for (const auto & msg : messages) {
        if (auto n = class_name_from_message(msg)) {
          add_name(std::string(short_name(*n)));
        }
      }
    } else {
      DiagnosticBag diags;
      if (const auto tree = parse_php(path, *text, &diags)) {
        (void)check_missing_imports(*tree, index, diags);
      }
      for (const auto & d : diags.with_code(k_missing_import_code)) {
        if (!d.primary_range().touches(SourceLocation(byte_offset))) {
          continue;
        }
        if (auto n = class_name_from_message(d.message)) {
          add_name(std::string(short_name(*n)));
        }
      }
    }

    // Fall back to a capitalized word under the cursor that is not imported yet.
    if (names.empty()) {
      const auto word = word_at(*text, byte_offset);
      if (word && looks_like_class_name(*word)) {
        const ImportBlock block = find_import_block(file);
        const bool imported = std::any_of(
          block.statements.begin(), block.statements.end(), [&](const ImportStatement & s) {
            return std::any_of(s.fqns.begin(), s.fqns.end(), [&](const std::string & f) {
              return iequals(short_name(f), *word);
            });
          });
        if (!imported) {
          add_name(*word);
        }
      }
    }

    for (const auto & name : names) {
      std::vector<std::string> fqns;
      for (const auto & def : index.lookup_definitions(name)) {
        if (!def.fqn.empty() && std::find(fqns.begin(), fqns.end(), def.fqn) == fqns.end()) {
          fqns.push_back(def.fqn);
        }
      }

      if (fqns.empty()) {
        json action;
        action["title"] = "Add import for " + name + " (not found in index)";
        action["kind"] = "quickfix";
        action["isPreferred"] = false;
        action["edits"] = json::array();
        out["actions"].push_back(std::move(action));
        continue;
      }

      for (const auto & fqn : fqns) {
        json action;
        action["title"] = "Add import for " + fqn;
        action["kind"] = "quickfix";
        action["isPreferred"] = fqns.size() == 1;
        action["edits"] = json::array();
        if (const auto op = plan_import_edit(file, {fqn})) {
          action["edits"].push_back(edit_to_json(*op));
        }
        out["actions"].push_back(std::move(action));
      }
    }

    if (const auto tree = parse_php(path, *text)) {
      for (auto & doc_action : plan_doc_block_actions(*tree, byte_offset)) {
        json action;
        action["title"] = std::move(doc_action.title);
        action["kind"] = "refactor.rewrite";
        action["isPreferred"] = false;
        action["edits"] = json::array({edit_to_json(doc_action.edit)});
        out["actions"].push_back(std::move(action));
      }
    }
    return out;
  }

  json analyze_json_impl(std::string_view uri)
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    if (!analyzer) {
      analyzer = std::make_unique<ExternalAnalyzer>(
        ensure_resolver().project_root(), config.analyzer, logger);
    }
    out["active"] = analyzer->is_active();
    if (!analyzer->is_active()) {
      return out;
    }

    const fs::path path = uri_to_path(uri);
    const AnalysisResult result = analyzer->analyze(path);
    out["active"] = analyzer->is_active();
    if (!result.success) {
      out["error"] = result.error;
      return out;
    }

    const auto text = text_of(path);
    const SourceFile file(path, text.value_or(std::string()));
    DiagnosticBag diags;
    append_analyzer_diagnostics(result.messages, file, diags);
    for (const auto & d : diags) {
      out["items"].push_back(diagnostic_to_json(d, file));
    }
    return out;
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace(std::shared_ptr<spdlog::logger> logger) : impl_(new Impl(std::move(logger))) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

bool Workspace::load_project(std::string_view root, std::string * error)
{
  const fs::path root_path = uri_to_path(root);
  const bool ok = impl_->load_config(root_path, error);

  impl_->resolver = std::make_unique<NamespaceResolver>(root_path, impl_->logger);
  impl_->files.clear();
  impl_->index.clear();
  return ok;
}

std::string Workspace::project_root() const
{
  return impl_->ensure_resolver().project_root().string();
}

void Workspace::set_document(std::string uri, std::string text)
{
  impl_->documents.upsert(uri_to_path(uri), std::move(text));
}

void Workspace::remove_document(std::string_view uri) { impl_->documents.remove(uri_to_path(uri)); }

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->documents.contains(uri_to_path(uri));
}

std::string Workspace::index_workspace_json() { return impl_->index_json().dump(); }

void Workspace::did_save(std::string_view uri)
{
  const fs::path path = uri_to_path(uri);
  const std::string name = path.filename().string();
  if (name == k_composer_file_name) {
    impl_->ensure_resolver().reload();
    return;
  }
  if (name == k_project_config_file_name) {
    (void)impl_->load_config(impl_->ensure_resolver().project_root());
    return;
  }
  impl_->track_file(path);
  impl_->rescan(path);
}

void Workspace::did_delete(std::string_view uri)
{
  const fs::path path = uri_to_path(uri);
  impl_->index.remove_file(path);
  impl_->documents.remove(path);
  impl_->untrack_file(path);
}

void Workspace::did_move(std::string_view old_uri, std::string_view new_uri)
{
  const fs::path old_path = uri_to_path(old_uri);
  const fs::path new_path = uri_to_path(new_uri);
  impl_->index.remove_file(old_path);
  impl_->untrack_file(old_path);
  if (const SourceFile * doc = impl_->documents.find(old_path)) {
    std::string text(doc->content());
    impl_->documents.remove(old_path);
    impl_->documents.upsert(new_path, std::move(text));
  }
  impl_->track_file(new_path);
  impl_->rescan(new_path);
}

bool Workspace::is_index_ready() const { return impl_->index.is_ready(); }

std::string Workspace::diagnostics_json(std::string_view uri)
{
  return impl_->diagnostics_json_impl(uri).dump();
}

std::string Workspace::definition_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->definition_json_impl(uri, byte_offset).dump();
}

std::string Workspace::implementation_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->implementation_json_impl(uri, byte_offset).dump();
}

std::string Workspace::references_json(std::string_view uri, uint32_t byte_offset)
{
  return impl_->references_json_impl(uri, byte_offset).dump();
}

std::string Workspace::rename_method_json(
  std::string_view uri, uint32_t byte_offset, std::string_view new_name)
{
  const fs::path path = uri_to_path(uri);
  const auto text = impl_->text_of(path);
  if (!text) {
    return refactor_result_to_json(RefactorResult::fail("cannot read " + path.string())).dump();
  }
  byte_offset = clamp_byte_offset(byte_offset, text->size());
  const auto word = word_at(*text, byte_offset);
  if (!word) {
    return refactor_result_to_json(RefactorResult::fail("no method name at the cursor")).dump();
  }
  const RefactorResult r = impl_->planner().rename_method(path, *word, new_name, byte_offset);
  return refactor_result_to_json(r).dump();
}

std::string Workspace::move_file_json(std::string_view old_uri, std::string_view new_uri)
{
  const RefactorResult r =
    impl_->planner().move_file(uri_to_path(old_uri), uri_to_path(new_uri));
  return refactor_result_to_json(r).dump();
}

std::string Workspace::add_import_json(std::string_view uri, const std::vector<std::string> & fqns)
{
  const RefactorResult r = impl_->planner().add_imports(uri_to_path(uri), fqns);
  return refactor_result_to_json(r).dump();
}

std::string Workspace::code_actions_json(
  std::string_view uri, uint32_t byte_offset, const std::vector<std::string> & diagnostic_messages)
{
  return impl_->code_actions_json_impl(uri, byte_offset, diagnostic_messages).dump();
}

std::string Workspace::analyze_json(std::string_view uri)
{
  return impl_->analyze_json_impl(uri).dump();
}

}  // namespace php_refactor::lsp
