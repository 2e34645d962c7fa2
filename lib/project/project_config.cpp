// php_refactor/project/project_config.cpp - Project configuration implementation
//
#include "php_refactor/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace php_refactor
{

namespace
{

std::optional<std::string> parse_indexer(const YAML::Node & node, IndexerConfig & out)
{
  if (!node.IsMap()) {
    return std::string("indexer must be a map");
  }

  if (node["exclude_vendor"]) {
    out.exclude_vendor = node["exclude_vendor"].as<bool>();
  }

  if (node["exclude"]) {
    if (!node["exclude"].IsSequence()) {
      return std::string("indexer.exclude must be a list");
    }
    out.exclude.clear();
    for (const auto & e : node["exclude"]) {
      out.exclude.push_back(e.as<std::string>());
    }
  }

  if (node["time_slice_ms"]) {
    const int slice = node["time_slice_ms"].as<int>();
    if (slice <= 0) {
      return std::string("indexer.time_slice_ms must be positive");
    }
    out.time_slice_ms = static_cast<uint32_t>(slice);
  }

  return std::nullopt;
}

std::optional<std::string> parse_analyzer(const YAML::Node & node, AnalyzerConfig & out)
{
  if (!node.IsMap()) {
    return std::string("analyzer must be a map");
  }

  if (node["enabled"]) {
    out.enabled = node["enabled"].as<bool>();
  }
  if (node["executable"]) {
    out.executable = node["executable"].as<std::string>();
  }
  if (node["php"]) {
    out.php = node["php"].as<std::string>();
  }
  if (node["level"]) {
    out.level = node["level"].as<std::string>();
  }
  if (node["timeout_ms"]) {
    const int timeout = node["timeout_ms"].as<int>();
    if (timeout <= 0) {
      return std::string("analyzer.timeout_ms must be positive");
    }
    out.timeout_ms = static_cast<uint32_t>(timeout);
  }

  return std::nullopt;
}

}  // namespace

ProjectConfig default_project_config(const std::filesystem::path & root)
{
  ProjectConfig config;
  config.project_root = std::filesystem::absolute(root);
  return config;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config = default_project_config(fs::absolute(config_path).parent_path());

  // An empty file is a valid "all defaults" configuration.
  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of " + config_path.filename().string() + " must be a map");
  }

  try {
    if (root["indexer"]) {
      if (auto err = parse_indexer(root["indexer"], config.indexer)) {
        return ConfigLoadResult::fail(*err);
      }
    }
    if (root["analyzer"]) {
      if (auto err = parse_analyzer(root["analyzer"], config.analyzer)) {
        return ConfigLoadResult::fail(*err);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
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
