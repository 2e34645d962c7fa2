// php_refactor/project/project_config.hpp - Project configuration (phpref.yaml)
//
// Parses and validates phpref.yaml project configuration files.
// Shared by the CLI and the LSP server.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace php_refactor
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Workspace scanning section.
 */
struct IndexerConfig
{
  /// Skip the vendor directory during scans
  bool exclude_vendor = true;

  /// Directory names never descended into
  std::vector<std::string> exclude = {"vendor", "node_modules", "storage", "var"};

  /// Cooperative yield interval for full scans
  uint32_t time_slice_ms = 50;
};

/**
 * External static analyzer (PHPStan) section.
 */
struct AnalyzerConfig
{
  bool enabled = true;

  /// Empty: detect vendor/bin/phpstan, then phpstan on PATH
  std::string executable;

  /// PHP interpreter used to run a vendored phpstan script
  std::string php = "php";

  std::string level = "max";

  uint32_t timeout_ms = 30000;
};

/**
 * Complete project configuration (phpref.yaml).
 */
struct ProjectConfig
{
  IndexerConfig indexer;
  AnalyzerConfig analyzer;

  /// Directory containing phpref.yaml (or the working directory when absent)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a phpref.yaml file.
 *
 * @param config_path Path to phpref.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to phpref.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Defaults rooted at `root`; used when no phpref.yaml exists.
[[nodiscard]] ProjectConfig default_project_config(const std::filesystem::path & root);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "phpref.yaml";

}  // namespace php_refactor
