// php_refactor/basic/logging.hpp - Shared spdlog logger access
#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace php_refactor
{

inline constexpr const char * k_logger_name = "php_refactor";

/**
 * Returns the process-wide "php_refactor" logger, creating a colored stderr
 * logger on first use. Library services take an optional logger and fall
 * back to this one.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> default_logger();

/// Returns `logger` when non-null, otherwise default_logger().
[[nodiscard]] std::shared_ptr<spdlog::logger> logger_or_default(
  std::shared_ptr<spdlog::logger> logger);

/// Set the level of the default logger ("trace", "debug", "info", "warn", ...)
void set_log_level(spdlog::level::level_enum level);

}  // namespace php_refactor
