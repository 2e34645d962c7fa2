// php_refactor/basic/logging.cpp - Shared spdlog logger access
#include "php_refactor/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace php_refactor
{

std::shared_ptr<spdlog::logger> default_logger()
{
  static std::mutex mutex;
  const std::lock_guard<std::mutex> lock(mutex);

  if (auto existing = spdlog::get(k_logger_name)) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(k_logger_name);
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(spdlog::level::warn);
  return logger;
}

std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger)
{
  if (logger) {
    return logger;
  }
  return default_logger();
}

void set_log_level(spdlog::level::level_enum level) { default_logger()->set_level(level); }

}  // namespace php_refactor
