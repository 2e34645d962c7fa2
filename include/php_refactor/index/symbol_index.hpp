// php_refactor/index/symbol_index.hpp - Workspace symbol index
//
// Definitions, method definitions, inheritance edges and a coarse usage index,
// built by a full workspace scan and kept current by per-file re-scans.
//
#pragma once

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor
{

// ============================================================================
// Index records
// ============================================================================

enum class SymbolKind : uint8_t {
  Class,
  Interface,
  Trait,
  Enum,
  Method,
};

[[nodiscard]] const char * to_string(SymbolKind kind) noexcept;

struct SymbolDefinition
{
  std::string name;
  std::string fqn;
  SymbolKind kind = SymbolKind::Class;
  fs::path path;
  FullSourceRange range;       ///< whole declaration
  FullSourceRange name_range;  ///< declared identifier
  std::string parent;          ///< methods: short name of the owning type
  std::string parent_fqn;      ///< methods: FQN of the owning type
};

struct InheritanceEdge
{
  std::string class_name;
  std::string class_fqn;
  std::optional<std::string> extends_name;  ///< as written
  std::set<std::string> implements_names;   ///< as written
  SymbolKind kind = SymbolKind::Class;
  fs::path path;
};

struct IndexStats
{
  size_t files = 0;
  size_t usage_symbols = 0;
  size_t definitions = 0;
  size_t methods = 0;
  size_t inheritance = 0;
};

// ============================================================================
// Workspace scan control
// ============================================================================

enum class ScanResult : uint8_t {
  Completed,
  AlreadyRunning,
  Cancelled,
};

[[nodiscard]] const char * to_string(ScanResult result) noexcept;

struct ScanCallbacks
{
  /// Called once per elapsed time slice; returning false abandons the scan.
  std::function<bool()> yield;

  /// Called every k_progress_interval files and once at the end.
  std::function<void(size_t done, size_t total)> progress;
};

// ============================================================================
// SymbolIndex
// ============================================================================

/**
 * Owned index service. Mutated only by scan/remove operations; every
 * mutation for a path first drops all entries attributed to that path.
 */
class SymbolIndex
{
public:
  static constexpr size_t k_progress_interval = 50;
  static constexpr std::chrono::milliseconds k_default_time_slice{50};

  explicit SymbolIndex(std::shared_ptr<spdlog::logger> logger = nullptr);

  // --- Mutation -------------------------------------------------------------

  /// Replace every entry of `tree.path()` with the contents of `tree`.
  void scan_file(const SyntaxTree & tree);

  /// Parse `text` as `path` and index it. On parse failure the file's entries
  /// are removed and false is returned.
  bool scan_text(const fs::path & path, std::string text);

  /// Read, parse and index a file from disk.
  bool scan_file_from_disk(const fs::path & path);

  void remove_file(const fs::path & path);

  void clear();

  /**
   * Index `files`, yielding through `callbacks.yield` every `time_slice`.
   * On completion entries of previously indexed files absent from `files`
   * are dropped and the index becomes ready.
   */
  ScanResult scan_workspace(
    const std::vector<fs::path> & files, const ScanCallbacks & callbacks = {},
    std::chrono::milliseconds time_slice = k_default_time_slice);

  /// clear() followed by scan_workspace().
  ScanResult rebuild(
    const std::vector<fs::path> & files, const ScanCallbacks & callbacks = {},
    std::chrono::milliseconds time_slice = k_default_time_slice);

  // --- Queries --------------------------------------------------------------

  [[nodiscard]] std::vector<SymbolDefinition> lookup_definitions(std::string_view name) const;

  /// Methods keyed `ShortClass::method`; a namespaced `class_fqn` also filters by owner FQN.
  [[nodiscard]] std::vector<SymbolDefinition> lookup_method(
    std::string_view class_fqn, std::string_view method) const;

  /// Classes whose implements list names `interface_name` (last segment compare).
  [[nodiscard]] std::vector<std::string> implementations_of(std::string_view interface_name) const;

  [[nodiscard]] std::vector<InheritanceEdge> inheritance_of(std::string_view class_name) const;

  /// Files that mention `name` anywhere (coarse, not authoritative).
  [[nodiscard]] std::vector<fs::path> usage_candidates(std::string_view name) const;

  [[nodiscard]] std::vector<SymbolDefinition> symbols_by_kind(
    const std::vector<SymbolKind> & kinds) const;

  /// Every `Class::method` definition with that method name.
  [[nodiscard]] std::vector<SymbolDefinition> methods_named(std::string_view method) const;

  [[nodiscard]] std::vector<fs::path> indexed_files() const;

  [[nodiscard]] bool contains_file(const fs::path & path) const;

  [[nodiscard]] IndexStats stats() const;

  [[nodiscard]] bool is_ready() const noexcept { return ready_; }
  [[nodiscard]] bool is_indexing() const noexcept { return indexing_; }

private:
  struct FileEntries
  {
    fs::path path;
    std::vector<std::string> definition_names;
    std::vector<std::string> method_keys;
    std::vector<std::string> inheritance_names;
    std::vector<std::string> usage_names;
  };

  [[nodiscard]] static std::string file_key(const fs::path & path);

  std::shared_ptr<spdlog::logger> logger_;

  std::unordered_map<std::string, std::vector<SymbolDefinition>> definitions_;
  std::unordered_map<std::string, std::vector<SymbolDefinition>> methods_;
  std::unordered_map<std::string, std::vector<InheritanceEdge>> inheritance_;
  std::unordered_map<std::string, std::set<std::string>> usages_;  // name -> file keys
  std::unordered_map<std::string, FileEntries> files_;

  bool indexing_ = false;
  bool ready_ = false;
};

}  // namespace php_refactor
