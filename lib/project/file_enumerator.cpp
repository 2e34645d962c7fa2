// php_refactor/project/file_enumerator.cpp - Workspace source file discovery
#include "php_refactor/project/file_enumerator.hpp"

#include <algorithm>

#include "php_refactor/basic/logging.hpp"

namespace php_refactor
{

namespace fs = std::filesystem;

bool EnumerateOptions::is_excluded(const std::string & name) const
{
  if (name == "vendor" && !exclude_vendor) {
    return false;
  }
  return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

std::vector<fs::path> enumerate_source_files(
  const fs::path & root, const EnumerateOptions & options,
  const std::shared_ptr<spdlog::logger> & logger)
{
  const auto log = logger_or_default(logger);
  std::vector<fs::path> files;

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log->warn("cannot scan {}: {}", root.string(), ec.message());
    return files;
  }

  fs::recursive_directory_iterator end_it;
  while (it != end_it) {
    const fs::directory_entry & entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (options.is_excluded(entry.path().filename().string())) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(type_ec) && entry.path().extension() == options.extension) {
      files.push_back(entry.path());
    }

    it.increment(ec);
    if (ec) {
      // The iterator is at its end after a failed increment.
      log->warn("stopped scanning {}: {}", root.string(), ec.message());
      break;
    }
  }

  std::sort(files.begin(), files.end());
  log->debug("found {} source file(s) under {}", files.size(), root.string());
  return files;
}

bool is_excluded_path(const fs::path & root, const fs::path & path, const EnumerateOptions & options)
{
  const fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
  const fs::path & walk = rel.empty() ? path : rel;
  for (const auto & part : walk.parent_path()) {
    if (options.is_excluded(part.string())) {
      return true;
    }
  }
  return false;
}

}  // namespace php_refactor
