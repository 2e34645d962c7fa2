// php_refactor/test_support/temp_project.hpp - helpers for unit/integration tests
//
// A throwaway project directory on disk plus a single-file parse wrapper.
// Multi-file refactoring tests write their PHP sources and composer.json here
// and point the resolver and index at root().
//
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "php_refactor/basic/diagnostic.hpp"
#include "php_refactor/basic/source_manager.hpp"
#include "php_refactor/syntax/syntax_tree.hpp"

namespace php_refactor::test_support
{

class TempProject
{
public:
  explicit TempProject(std::string_view prefix = "phpref_test")
  {
    static uint32_t counter = 0;
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TempProject()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempProject(const TempProject &) = delete;
  TempProject & operator=(const TempProject &) = delete;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  [[nodiscard]] std::filesystem::path path(std::string_view rel) const
  {
    return (root_ / std::string(rel)).lexically_normal();
  }

  std::filesystem::path write(std::string_view rel, std::string_view content) const
  {
    const auto p = path(rel);
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
    out << content;
    return p;
  }

  [[nodiscard]] std::string read(std::string_view rel) const
  {
    std::ifstream in(path(rel), std::ios::in | std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  /// composer.json with a single PSR-4 mapping.
  std::filesystem::path write_composer(std::string_view prefix, std::string_view dir) const
  {
    std::string escaped;
    for (const char c : prefix) {
      if (c == '\\') {
        escaped += "\\\\";
      } else {
        escaped.push_back(c);
      }
    }
    return write(
      "composer.json", "{\n  \"autoload\": {\n    \"psr-4\": {\n      \"" + escaped + "\": \"" +
                         std::string(dir) + "\"\n    }\n  }\n}\n");
  }

private:
  std::filesystem::path root_;
};

struct TestParseUnit
{
  std::unique_ptr<SyntaxTree> tree;
  DiagnosticBag diags;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return tree->file().get_slice(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "/tmp/phpref_test.php")
{
  TestParseUnit out;
  out.tree = parse_php(virtual_path, std::move(src), &out.diags);
  return out;
}

[[nodiscard]] inline uint32_t offset_of(std::string_view text, std::string_view needle, size_t nth = 0)
{
  size_t pos = text.find(needle);
  while (pos != std::string_view::npos && nth > 0) {
    pos = text.find(needle, pos + 1);
    --nth;
  }
  return pos == std::string_view::npos ? 0U : static_cast<uint32_t>(pos);
}

}  // namespace php_refactor::test_support
