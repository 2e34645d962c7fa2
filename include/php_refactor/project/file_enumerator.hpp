// php_refactor/project/file_enumerator.hpp - Workspace source file discovery
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "php_refactor/project/project_config.hpp"

namespace php_refactor
{

struct EnumerateOptions
{
  /// Directory names never descended into
  std::vector<std::string> exclude = {"vendor", "node_modules", "storage", "var"};

  /// When false, a "vendor" entry in `exclude` is ignored
  bool exclude_vendor = true;

  std::string extension = ".php";

  [[nodiscard]] static EnumerateOptions from_config(const IndexerConfig & config)
  {
    EnumerateOptions o;
    o.exclude = config.exclude;
    o.exclude_vendor = config.exclude_vendor;
    return o;
  }

  /// True when a directory called `name` must be skipped.
  [[nodiscard]] bool is_excluded(const std::string & name) const;
};

/**
 * All source files below `root`, sorted. Unreadable directories are skipped
 * with a warning.
 */
[[nodiscard]] std::vector<std::filesystem::path> enumerate_source_files(
  const std::filesystem::path & root, const EnumerateOptions & options = {},
  const std::shared_ptr<spdlog::logger> & logger = nullptr);

/// True when a path component of `path` (relative to `root`) is excluded.
[[nodiscard]] bool is_excluded_path(
  const std::filesystem::path & root, const std::filesystem::path & path,
  const EnumerateOptions & options);

}  // namespace php_refactor
