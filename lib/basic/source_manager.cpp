// php_refactor/basic/source_manager.cpp - Source file and registry implementation
#include "php_refactor/basic/source_manager.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace php_refactor
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

void SourceFile::set_content(std::string new_content)
{
  content_ = std::move(new_content);
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

uint32_t SourceFile::get_offset(uint32_t line, uint32_t column) const noexcept
{
  if (line == 0 || line_offsets_.empty()) {
    return 0;
  }
  if (line > line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }
  const uint32_t start = line_offsets_[line - 1];
  const auto line_len = static_cast<uint32_t>(get_line(line - 1).size());
  const uint32_t col = column == 0 ? 0 : column - 1;
  return start + std::min(col, line_len);
}

uint32_t SourceFile::get_line_offset(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }
  return line_offsets_[line_index];
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.get_begin().offset();
  auto end = range.get_end().offset();
  if (start > content_.size()) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  if (end < start) {
    return {};
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::normalize_key(const fs::path & path)
{
  try {
    return fs::weakly_canonical(path).string();
  } catch (const fs::filesystem_error &) {
    return path.lexically_normal().string();
  }
}

const SourceFile & SourceRegistry::upsert(const fs::path & path, std::string content)
{
  const std::string key = normalize_key(path);
  if (auto it = files_.find(key); it != files_.end()) {
    it->second.set_content(std::move(content));
    return it->second;
  }
  auto [it, inserted] = files_.emplace(key, SourceFile(path, std::move(content)));
  (void)inserted;
  return it->second;
}

bool SourceRegistry::remove(const fs::path & path) { return files_.erase(normalize_key(path)) > 0; }

const SourceFile * SourceRegistry::find(const fs::path & path) const
{
  const auto it = files_.find(normalize_key(path));
  return it == files_.end() ? nullptr : &it->second;
}

std::optional<std::string> SourceRegistry::read(const fs::path & path) const
{
  if (const auto * f = find(path)) {
    return std::string(f->content());
  }
  return read_file_to_string(path);
}

std::optional<std::string> read_file_to_string(const fs::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

}  // namespace php_refactor
