// php_refactor/lsp.hpp - LSP-like refactoring service APIs (serverless)
#pragma once

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace php_refactor::lsp
{

/**
 * Serverless refactoring service for a PHP project.
 *
 * Owns the project configuration, the namespace resolver, the symbol index,
 * the open-document overlay and the edit planner. Every query returns a JSON
 * string so that any host (the stdio LSP server, the CLI, tests) can drive it
 * without linking against the engine's types.
 *
 * Documents are addressed by `file://` URIs or plain paths. Positions are
 * UTF-8 byte offsets; ranges in results carry both bytes and 1-based
 * line/column (`startByte`, `endByte`, `startLine`, `startColumn`, `endLine`,
 * `endColumn`).
 */
class Workspace
{
public:
  explicit Workspace(std::shared_ptr<spdlog::logger> logger = nullptr);
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  /**
   * Use `root` as the project root: reads phpref.yaml (defaults when absent)
   * and composer.json. Returns false, with `error` set, when phpref.yaml is
   * invalid; defaults are used in that case.
   */
  bool load_project(std::string_view root, std::string * error = nullptr);

  [[nodiscard]] std::string project_root() const;

  // Open documents (unsaved editor content takes precedence over disk)
  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  // Index lifecycle
  std::string index_workspace_json();
  void did_save(std::string_view uri);
  void did_delete(std::string_view uri);
  void did_move(std::string_view old_uri, std::string_view new_uri);
  [[nodiscard]] bool is_index_ready() const;

  // Diagnostics (parse errors + missing imports)
  std::string diagnostics_json(std::string_view uri);

  // Navigation
  std::string definition_json(std::string_view uri, uint32_t byte_offset);
  std::string implementation_json(std::string_view uri, uint32_t byte_offset);
  std::string references_json(std::string_view uri, uint32_t byte_offset);

  // Refactorings: {"success", "error", "warnings", "edits": [{uri, range, newText}]}
  std::string rename_method_json(
    std::string_view uri, uint32_t byte_offset, std::string_view new_name);
  std::string move_file_json(std::string_view old_uri, std::string_view new_uri);
  std::string add_import_json(std::string_view uri, const std::vector<std::string> & fqns);

  /**
   * Import quick-fixes at `byte_offset`. `diagnostic_messages` are the
   * messages of the diagnostics the host reports at that position; when
   * empty the workspace computes its own.
   */
  std::string code_actions_json(
    std::string_view uri, uint32_t byte_offset,
    const std::vector<std::string> & diagnostic_messages = {});

  // External static analysis
  std::string analyze_json(std::string_view uri);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace php_refactor::lsp
