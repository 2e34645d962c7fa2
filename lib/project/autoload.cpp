// php_refactor/project/autoload.cpp - PSR-4 namespace resolution from composer.json
#include "php_refactor/project/autoload.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

#include "php_refactor/basic/logging.hpp"

namespace php_refactor
{

namespace fs = std::filesystem;
using ordered_json = nlohmann::ordered_json;

namespace
{

std::string normalize_directory(std::string dir)
{
  std::replace(dir.begin(), dir.end(), '\\', '/');
  while (dir.rfind("./", 0) == 0) {
    dir.erase(0, 2);
  }
  while (!dir.empty() && dir.back() == '/') {
    dir.pop_back();
  }
  if (dir == ".") {
    dir.clear();
  }
  return dir;
}

/// Append or override entries of one "psr-4" object, preserving first-seen order.
void merge_psr4(const ordered_json & section, std::vector<std::pair<std::string, ordered_json>> & out)
{
  if (!section.is_object()) {
    return;
  }
  for (const auto & [prefix, dirs] : section.items()) {
    auto it = std::find_if(out.begin(), out.end(), [&](const auto & e) { return e.first == prefix; });
    if (it != out.end()) {
      it->second = dirs;
    } else {
      out.emplace_back(prefix, dirs);
    }
  }
}

/// Directory of `file` relative to `root` with '/' separators; none when outside.
std::optional<std::string> relative_directory(const fs::path & root, const fs::path & file)
{
  std::error_code ec;
  const fs::path abs_root = fs::weakly_canonical(root, ec);
  if (ec) {
    return std::nullopt;
  }
  const fs::path abs_file = fs::weakly_canonical(fs::absolute(file), ec);
  if (ec) {
    return std::nullopt;
  }

  const fs::path rel = abs_file.parent_path().lexically_relative(abs_root);
  if (rel.empty() && abs_file.parent_path() != abs_root) {
    return std::nullopt;
  }
  std::string out = rel.generic_string();
  if (out.rfind("..", 0) == 0) {
    return std::nullopt;
  }
  if (out == ".") {
    out.clear();
  }
  return out;
}

}  // namespace

NamespaceResolver::NamespaceResolver(fs::path project_root, std::shared_ptr<spdlog::logger> logger)
: root_(std::move(project_root)), logger_(logger_or_default(std::move(logger)))
{
}

void NamespaceResolver::reload()
{
  loaded_ = false;
  configured_ = false;
  mappings_.clear();
}

bool NamespaceResolver::has_configuration() const
{
  ensure_loaded();
  return configured_;
}

const std::vector<Psr4Mapping> & NamespaceResolver::mappings() const
{
  ensure_loaded();
  return mappings_;
}

void NamespaceResolver::ensure_loaded() const
{
  if (loaded_) {
    return;
  }
  loaded_ = true;
  configured_ = false;
  mappings_.clear();

  const fs::path composer_path = root_ / k_composer_file_name;
  std::ifstream in(composer_path);
  if (!in.is_open()) {
    logger_->debug("no {} under {}", k_composer_file_name, root_.string());
    return;
  }

  ordered_json composer;
  try {
    composer = ordered_json::parse(in);
  } catch (const nlohmann::json::exception & e) {
    logger_->warn("failed to read {}: {}", composer_path.string(), e.what());
    return;
  }
  if (!composer.is_object()) {
    logger_->warn("{} is not a JSON object", composer_path.string());
    return;
  }

  std::vector<std::pair<std::string, ordered_json>> merged;
  for (const char * section : {"autoload", "autoload-dev"}) {
    const auto it = composer.find(section);
    if (it == composer.end() || !it->is_object()) {
      continue;
    }
    const auto psr4 = it->find("psr-4");
    if (psr4 != it->end()) {
      merge_psr4(*psr4, merged);
    }
  }

  for (const auto & [prefix, dirs] : merged) {
    if (dirs.is_string()) {
      mappings_.push_back({prefix, normalize_directory(dirs.get<std::string>())});
    } else if (dirs.is_array()) {
      for (const auto & d : dirs) {
        if (d.is_string()) {
          mappings_.push_back({prefix, normalize_directory(d.get<std::string>())});
        }
      }
    }
  }

  configured_ = true;
  logger_->debug("loaded {} PSR-4 mapping(s) from {}", mappings_.size(), composer_path.string());
}

std::optional<std::string> NamespaceResolver::resolve(const fs::path & file_path) const
{
  ensure_loaded();
  if (!configured_) {
    return std::nullopt;
  }

  const auto rel_dir = relative_directory(root_, file_path);
  if (!rel_dir) {
    return std::nullopt;
  }

  const Psr4Mapping * best = nullptr;
  for (const auto & m : mappings_) {
    const bool matches = m.directory.empty() || *rel_dir == m.directory ||
                         rel_dir->rfind(m.directory + "/", 0) == 0;
    if (!matches) {
      continue;
    }
    // '>=' keeps the last declared candidate among equal lengths.
    if (best == nullptr || m.directory.size() >= best->directory.size()) {
      best = &m;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }

  std::string sub = rel_dir->substr(best->directory.size());
  if (!sub.empty() && sub.front() == '/') {
    sub.erase(0, 1);
  }
  std::replace(sub.begin(), sub.end(), '/', '\\');

  std::string ns = best->prefix;
  if (!sub.empty() && !ns.empty() && ns.back() != '\\') {
    ns += '\\';
  }
  ns += sub;
  while (!ns.empty() && ns.back() == '\\') {
    ns.pop_back();
  }
  while (!ns.empty() && ns.front() == '\\') {
    ns.erase(0, 1);
  }

  if (ns.empty()) {
    return std::nullopt;
  }
  return ns;
}

std::optional<fs::path> find_autoload_root(const fs::path & start)
{
  std::error_code ec;
  fs::path current = fs::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    if (fs::exists(current / k_composer_file_name, ec)) {
      return current;
    }
    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }
  return std::nullopt;
}

}  // namespace php_refactor
