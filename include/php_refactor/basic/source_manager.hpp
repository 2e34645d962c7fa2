// php_refactor/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges,
// per-file line tables and an overlay registry of in-memory documents.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace php_refactor
{

namespace fs = std::filesystem;

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Internally stores a byte offset into the source file. Line and column
 * information can be computed on demand via SourceFile.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}

  /// Create a location from byte offset
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }

  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>(SourceLocation other) const noexcept
  {
    return offset_ > other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(SourceLocation other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A range of source code defined by start and end locations.
 *
 * The range is inclusive of the start and exclusive of the end,
 * following the half-open interval convention [start, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool is_empty() const noexcept { return start_ == end_; }

  /// Check if a location is contained within this range
  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return loc >= start_ && loc < end_;
  }

  /// Like contains(), but also accepts the end position (cursor right after a word)
  [[nodiscard]] constexpr bool touches(SourceLocation loc) const noexcept
  {
    return loc >= start_ && loc <= end_;
  }

  /// Check if another range is fully contained within this range
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.start_ >= start_ && other.end_ <= end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.offset() - start_.offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Human-readable line and column position (1-indexed, column counted in bytes).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// FullSourceRange - Complete range with line/column info
// ============================================================================

/**
 * Extended source range including pre-computed line/column information.
 *
 * Used wherever a range leaves the owning file: index entries, edit
 * operations and JSON payloads.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] SourceRange to_source_range() const noexcept { return {start_byte, end_byte}; }

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }

  [[nodiscard]] bool operator==(const FullSourceRange & other) const noexcept
  {
    return start_byte == other.start_byte && end_byte == other.end_byte &&
           start_line == other.start_line && start_column == other.start_column &&
           end_line == other.end_line && end_column == other.end_column;
  }
};

// ============================================================================
// SourceFile - One file's content and line table
// ============================================================================

class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  void set_content(std::string new_content);

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Convert a 1-indexed line/column back to a byte offset (clamped to the line)
  [[nodiscard]] uint32_t get_offset(uint32_t line, uint32_t column) const noexcept;

  /// Byte offset of a line start (0-indexed line number)
  [[nodiscard]] uint32_t get_line_offset(uint32_t line_index) const noexcept;

  /// Content of a specific line (0-indexed), without the trailing newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

// ============================================================================
// SourceRegistry - In-memory documents keyed by normalized path
// ============================================================================

/**
 * Holds the editor's open documents. Lookups normalize paths so that
 * different spellings of the same file share one entry.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  /// Insert or replace the content of a document
  const SourceFile & upsert(const fs::path & path, std::string content);

  /// Drop a document. Returns true if it existed.
  bool remove(const fs::path & path);

  [[nodiscard]] const SourceFile * find(const fs::path & path) const;

  [[nodiscard]] bool contains(const fs::path & path) const { return find(path) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  /// Overlay content when open, otherwise the file on disk
  [[nodiscard]] std::optional<std::string> read(const fs::path & path) const;

  [[nodiscard]] static std::string normalize_key(const fs::path & path);

private:
  std::unordered_map<std::string, SourceFile> files_;
};

/// Read a whole file into memory. Returns std::nullopt if it cannot be opened.
[[nodiscard]] std::optional<std::string> read_file_to_string(const fs::path & path);

}  // namespace php_refactor
