// php_refactor/project/autoload.hpp - PSR-4 namespace resolution from composer.json
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace php_refactor
{

inline constexpr const char * k_composer_file_name = "composer.json";

/// One prefix -> directory pair of the autoload mapping.
struct Psr4Mapping
{
  std::string prefix;     ///< e.g. "App\\" as written in composer.json
  std::string directory;  ///< normalized, relative to the project root ("" = root)
};

/**
 * Maps file paths to their logical namespace.
 *
 * composer.json is read once, on first use, and cached until reload().
 * A missing or malformed composer.json makes every resolution return none.
 */
class NamespaceResolver
{
public:
  explicit NamespaceResolver(
    std::filesystem::path project_root, std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * Resolve the namespace a file at `file_path` should declare.
   *
   * The longest mapped directory containing the file's directory wins; among
   * equally long directories the one declared last wins.
   */
  [[nodiscard]] std::optional<std::string> resolve(const std::filesystem::path & file_path) const;

  /// Mapping entries in declaration order (autoload, then autoload-dev).
  [[nodiscard]] const std::vector<Psr4Mapping> & mappings() const;

  [[nodiscard]] bool has_configuration() const;

  /// Drop the cached mapping; the next query re-reads composer.json.
  void reload();

  [[nodiscard]] const std::filesystem::path & project_root() const noexcept { return root_; }

private:
  void ensure_loaded() const;

  std::filesystem::path root_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable bool loaded_ = false;
  mutable bool configured_ = false;
  mutable std::vector<Psr4Mapping> mappings_;
};

/// Nearest directory at or above `start` that contains composer.json.
[[nodiscard]] std::optional<std::filesystem::path> find_autoload_root(
  const std::filesystem::path & start);

}  // namespace php_refactor
