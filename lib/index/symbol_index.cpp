// php_refactor/index/symbol_index.cpp - Workspace symbol index
#include "php_refactor/index/symbol_index.hpp"

#include <algorithm>
#include <unordered_set>

#include "php_refactor/basic/logging.hpp"
#include "php_refactor/syntax/php_queries.hpp"

namespace php_refactor
{

const char * to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Class:
      return "class";
    case SymbolKind::Interface:
      return "interface";
    case SymbolKind::Trait:
      return "trait";
    case SymbolKind::Enum:
      return "enum";
    case SymbolKind::Method:
      return "method";
  }
  return "class";
}

const char * to_string(ScanResult result) noexcept
{
  switch (result) {
    case ScanResult::Completed:
      return "completed";
    case ScanResult::AlreadyRunning:
      return "already-running";
    case ScanResult::Cancelled:
      return "cancelled";
  }
  return "completed";
}

namespace
{

SymbolKind symbol_kind_for(SyntaxKind kind) noexcept
{
  switch (kind) {
    case SyntaxKind::InterfaceDeclaration:
      return SymbolKind::Interface;
    case SyntaxKind::TraitDeclaration:
      return SymbolKind::Trait;
    case SyntaxKind::EnumDeclaration:
      return SymbolKind::Enum;
    default:
      return SymbolKind::Class;
  }
}

std::string method_key(std::string_view class_name, std::string_view method)
{
  std::string key(class_name);
  key += "::";
  key += method;
  return key;
}

/// Drop every record of `file_key` from `map[name]`, erasing emptied buckets.
template <typename Map>
void erase_for_file(Map & map, const std::string & name, const std::string & file_key)
{
  const auto it = map.find(name);
  if (it == map.end()) {
    return;
  }
  auto & records = it->second;
  records.erase(
    std::remove_if(
      records.begin(), records.end(), [&](const auto & r) { return r.path.string() == file_key; }),
    records.end());
  if (records.empty()) {
    map.erase(it);
  }
}

/// Clears `flag` on scope exit.
class FlagGuard
{
public:
  explicit FlagGuard(bool & flag) : flag_(flag) { flag_ = true; }
  FlagGuard(const FlagGuard &) = delete;
  FlagGuard & operator=(const FlagGuard &) = delete;
  ~FlagGuard() { flag_ = false; }

private:
  bool & flag_;
};

}  // namespace

SymbolIndex::SymbolIndex(std::shared_ptr<spdlog::logger> logger)
: logger_(logger_or_default(std::move(logger)))
{
}

std::string SymbolIndex::file_key(const fs::path & path) { return SourceRegistry::normalize_key(path); }

// ============================================================================
// Mutation
// ============================================================================

void SymbolIndex::remove_file(const fs::path & path)
{
  const std::string key = file_key(path);
  const auto it = files_.find(key);
  if (it == files_.end()) {
    return;
  }

  const FileEntries & entries = it->second;
  for (const auto & name : entries.definition_names) {
    erase_for_file(definitions_, name, key);
  }
  for (const auto & mkey : entries.method_keys) {
    erase_for_file(methods_, mkey, key);
  }
  for (const auto & name : entries.inheritance_names) {
    erase_for_file(inheritance_, name, key);
  }
  for (const auto & name : entries.usage_names) {
    const auto u = usages_.find(name);
    if (u == usages_.end()) {
      continue;
    }
    u->second.erase(key);
    if (u->second.empty()) {
      usages_.erase(u);
    }
  }

  files_.erase(it);
}

void SymbolIndex::scan_file(const SyntaxTree & tree)
{
  const std::string key = file_key(tree.path());
  remove_file(tree.path());

  FileEntries entries;
  entries.path = fs::path(key);

  std::unordered_set<std::string> usage_names;

  for (const TypeDeclaration & decl : find_type_declarations(tree)) {
    SymbolDefinition def;
    def.name = decl.name;
    def.fqn = decl.fqn();
    def.kind = symbol_kind_for(decl.kind);
    def.path = entries.path;
    def.range = tree.full_range(decl.range);
    def.name_range = tree.full_range(decl.name_range);
    definitions_[def.name].push_back(def);
    entries.definition_names.push_back(def.name);
    usage_names.insert(def.name);

    const Heritage heritage = collect_heritage(decl.node);
    InheritanceEdge edge;
    edge.class_name = decl.name;
    edge.class_fqn = def.fqn;
    edge.kind = def.kind;
    edge.path = entries.path;
    if (heritage.extends) {
      edge.extends_name = heritage.extends->name;
    }
    for (const auto & impl : heritage.implements) {
      edge.implements_names.insert(impl.name);
    }
    inheritance_[decl.name].push_back(std::move(edge));
    entries.inheritance_names.push_back(decl.name);

    const SyntaxNode body = decl.node.field("body");
    for (const SyntaxNode & member : body.named_children()) {
      if (member.kind() != SyntaxKind::MethodDeclaration) {
        continue;
      }
      const SyntaxNode name = member.field("name");
      if (name.is_null()) {
        continue;
      }
      SymbolDefinition m;
      m.name = std::string(name.text());
      m.fqn = method_key(def.fqn, m.name);
      m.kind = SymbolKind::Method;
      m.path = entries.path;
      m.range = tree.full_range(member.range());
      m.name_range = tree.full_range(name.range());
      m.parent = decl.name;
      m.parent_fqn = def.fqn;

      const std::string mkey = method_key(decl.name, m.name);
      methods_[mkey].push_back(std::move(m));
      entries.method_keys.push_back(mkey);
    }
  }

  for (const UseItem & item : collect_imports(tree).items()) {
    usage_names.emplace(short_name(item.fqn));
  }
  for (auto & token : collect_name_tokens(tree)) {
    usage_names.insert(std::move(token));
  }

  for (const auto & name : usage_names) {
    usages_[name].insert(key);
    entries.usage_names.push_back(name);
  }

  files_[key] = std::move(entries);
}

bool SymbolIndex::scan_text(const fs::path & path, std::string text)
{
  std::unique_ptr<SyntaxTree> tree;
  try {
    tree = parse_php(path, std::move(text));
  } catch (const std::runtime_error & e) {
    logger_->error("parser unavailable: {}", e.what());
    return false;
  }

  if (!tree) {
    logger_->debug("skipping {}: parse failure", path.string());
    remove_file(path);
    return false;
  }
  scan_file(*tree);
  return true;
}

bool SymbolIndex::scan_file_from_disk(const fs::path & path)
{
  auto text = read_file_to_string(path);
  if (!text) {
    logger_->debug("skipping {}: cannot read file", path.string());
    remove_file(path);
    return false;
  }
  return scan_text(path, std::move(*text));
}

void SymbolIndex::clear()
{
  definitions_.clear();
  methods_.clear();
  inheritance_.clear();
  usages_.clear();
  files_.clear();
  ready_ = false;
}

ScanResult SymbolIndex::scan_workspace(
  const std::vector<fs::path> & files, const ScanCallbacks & callbacks,
  std::chrono::milliseconds time_slice)
{
  if (indexing_) {
    logger_->debug("scan requested while another scan is running");
    return ScanResult::AlreadyRunning;
  }
  const FlagGuard guard(indexing_);
  // A pass that does not complete leaves the index not ready.
  ready_ = false;

  using clock = std::chrono::steady_clock;
  auto slice_start = clock::now();
  const auto started = slice_start;

  std::unordered_set<std::string> scanned;
  size_t done = 0;
  size_t failed = 0;

  for (const auto & path : files) {
    if (callbacks.yield && clock::now() - slice_start > time_slice) {
      if (!callbacks.yield()) {
        logger_->info("scan cancelled after {}/{} files", done, files.size());
        return ScanResult::Cancelled;
      }
      slice_start = clock::now();
    }

    if (!scan_file_from_disk(path)) {
      ++failed;
    }
    scanned.insert(file_key(path));
    ++done;

    if (callbacks.progress && done % k_progress_interval == 0) {
      callbacks.progress(done, files.size());
    }
  }

  // Drop files indexed by an earlier pass that are no longer part of the workspace.
  std::vector<fs::path> stale;
  for (const auto & [key, entries] : files_) {
    if (scanned.count(key) == 0) {
      stale.push_back(entries.path);
    }
  }
  for (const auto & p : stale) {
    remove_file(p);
  }

  if (callbacks.progress) {
    callbacks.progress(done, files.size());
  }

  ready_ = true;

  const auto elapsed =
    std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started).count();
  const IndexStats s = stats();
  logger_->info(
    "index built in {} ms: {} files ({} skipped), {} usage symbols, {} definitions, {} methods, "
    "{} classes with inheritance",
    elapsed, s.files, failed, s.usage_symbols, s.definitions, s.methods, s.inheritance);
  return ScanResult::Completed;
}

ScanResult SymbolIndex::rebuild(
  const std::vector<fs::path> & files, const ScanCallbacks & callbacks,
  std::chrono::milliseconds time_slice)
{
  if (indexing_) {
    return ScanResult::AlreadyRunning;
  }
  clear();
  return scan_workspace(files, callbacks, time_slice);
}

// ============================================================================
// Queries
// ============================================================================

std::vector<SymbolDefinition> SymbolIndex::lookup_definitions(std::string_view name) const
{
  const auto it = definitions_.find(std::string(name));
  if (it == definitions_.end()) {
    return {};
  }
  return it->second;
}

std::vector<SymbolDefinition> SymbolIndex::lookup_method(
  std::string_view class_fqn, std::string_view method) const
{
  const auto it = methods_.find(method_key(short_name(class_fqn), method));
  if (it == methods_.end()) {
    return {};
  }
  if (class_fqn.find(k_ns_separator) == std::string_view::npos) {
    return it->second;
  }

  const std::string wanted = normalize_name(class_fqn);
  std::vector<SymbolDefinition> out;
  for (const auto & def : it->second) {
    if (iequals(def.parent_fqn, wanted)) {
      out.push_back(def);
    }
  }
  return out;
}

std::vector<std::string> SymbolIndex::implementations_of(std::string_view interface_name) const
{
  const std::string normalized = normalize_name(interface_name);
  const std::string_view wanted = short_name(normalized);
  std::set<std::string> names;
  for (const auto & [class_name, edges] : inheritance_) {
    for (const auto & edge : edges) {
      for (const auto & impl : edge.implements_names) {
        if (short_name(impl) == wanted) {
          names.insert(class_name);
        }
      }
    }
  }
  return {names.begin(), names.end()};
}

std::vector<InheritanceEdge> SymbolIndex::inheritance_of(std::string_view class_name) const
{
  const auto it = inheritance_.find(std::string(short_name(class_name)));
  if (it == inheritance_.end()) {
    return {};
  }
  return it->second;
}

std::vector<fs::path> SymbolIndex::usage_candidates(std::string_view name) const
{
  std::vector<fs::path> out;
  const auto it = usages_.find(std::string(name));
  if (it == usages_.end()) {
    return out;
  }
  for (const auto & key : it->second) {
    out.emplace_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<SymbolDefinition> SymbolIndex::symbols_by_kind(const std::vector<SymbolKind> & kinds) const
{
  std::vector<SymbolDefinition> out;
  const auto wanted = [&kinds](SymbolKind k) {
    return std::find(kinds.begin(), kinds.end(), k) != kinds.end();
  };

  for (const auto & [name, defs] : definitions_) {
    for (const auto & def : defs) {
      if (wanted(def.kind)) {
        out.push_back(def);
      }
    }
  }
  if (wanted(SymbolKind::Method)) {
    for (const auto & [key, defs] : methods_) {
      out.insert(out.end(), defs.begin(), defs.end());
    }
  }

  std::sort(out.begin(), out.end(), [](const SymbolDefinition & a, const SymbolDefinition & b) {
    if (a.fqn != b.fqn) return a.fqn < b.fqn;
    return a.path < b.path;
  });
  return out;
}

std::vector<SymbolDefinition> SymbolIndex::methods_named(std::string_view method) const
{
  std::vector<SymbolDefinition> out;
  for (const auto & [key, defs] : methods_) {
    for (const auto & def : defs) {
      if (def.name == method) {
        out.push_back(def);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const SymbolDefinition & a, const SymbolDefinition & b) {
    if (a.fqn != b.fqn) return a.fqn < b.fqn;
    return a.path < b.path;
  });
  return out;
}

std::vector<fs::path> SymbolIndex::indexed_files() const
{
  std::vector<fs::path> out;
  out.reserve(files_.size());
  for (const auto & [key, entries] : files_) {
    out.push_back(entries.path);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool SymbolIndex::contains_file(const fs::path & path) const
{
  return files_.count(file_key(path)) > 0;
}

IndexStats SymbolIndex::stats() const
{
  IndexStats s;
  s.files = files_.size();
  s.usage_symbols = usages_.size();
  s.definitions = definitions_.size();
  s.methods = methods_.size();
  s.inheritance = inheritance_.size();
  return s;
}

}  // namespace php_refactor
