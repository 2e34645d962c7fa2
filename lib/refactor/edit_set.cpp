// php_refactor/refactor/edit_set.cpp - Text edit operations and non-overlapping edit sets
#include "php_refactor/refactor/edit_set.hpp"

#include <algorithm>

#include "php_refactor/basic/logging.hpp"

namespace php_refactor
{

namespace
{

bool by_position(const EditOperation & a, const EditOperation & b)
{
  if (a.range.start_byte != b.range.start_byte) {
    return a.range.start_byte < b.range.start_byte;
  }
  return a.range.end_byte < b.range.end_byte;
}

}  // namespace

bool ranges_overlap(const FullSourceRange & a, const FullSourceRange & b) noexcept
{
  const bool a_empty = a.start_byte == a.end_byte;
  const bool b_empty = b.start_byte == b.end_byte;
  if (a_empty && b_empty) {
    return a.start_byte == b.start_byte;
  }
  if (a_empty) {
    return b.start_byte < a.start_byte && a.start_byte < b.end_byte;
  }
  if (b_empty) {
    return a.start_byte < b.start_byte && b.start_byte < a.end_byte;
  }
  return a.start_byte < b.end_byte && b.start_byte < a.end_byte;
}

std::string apply_edits(std::string_view text, gsl::span<const EditOperation> ops)
{
  std::vector<EditOperation> sorted(ops.begin(), ops.end());
  std::stable_sort(sorted.begin(), sorted.end(), by_position);

  std::string out(text);
  for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
    const size_t start = std::min<size_t>(it->range.start_byte, out.size());
    const size_t end = std::min<size_t>(std::max(it->range.end_byte, it->range.start_byte), out.size());
    out.replace(start, end - start, it->replacement_text);
  }
  return out;
}

// ============================================================================
// EditSet
// ============================================================================

EditSet::EditSet(std::shared_ptr<spdlog::logger> logger) : logger_(logger_or_default(std::move(logger)))
{
}

bool EditSet::add(EditOperation op)
{
  auto & ops = by_file_[SourceRegistry::normalize_key(op.target_file)];

  for (const auto & existing : ops) {
    if (existing.range == op.range && existing.replacement_text == op.replacement_text) {
      return true;
    }
  }
  for (const auto & existing : ops) {
    if (ranges_overlap(existing.range, op.range)) {
      ++rejected_;
      logger_->warn(
        "dropping overlapping edit in {} at {}:{} (conflicts with {}:{})", op.target_file.string(),
        op.range.start_line, op.range.start_column, existing.range.start_line,
        existing.range.start_column);
      return false;
    }
  }

  const auto pos = std::upper_bound(ops.begin(), ops.end(), op, by_position);
  ops.insert(pos, std::move(op));
  return true;
}

size_t EditSet::size() const noexcept
{
  size_t n = 0;
  for (const auto & [file, ops] : by_file_) {
    n += ops.size();
  }
  return n;
}

std::vector<EditOperation> EditSet::operations() const
{
  std::vector<EditOperation> out;
  for (const auto & [file, ops] : by_file_) {
    out.insert(out.end(), ops.begin(), ops.end());
  }
  return out;
}

std::vector<EditOperation> EditSet::for_file(const std::filesystem::path & file) const
{
  const auto it = by_file_.find(SourceRegistry::normalize_key(file));
  if (it == by_file_.end()) {
    return {};
  }
  return it->second;
}

std::vector<std::filesystem::path> EditSet::files() const
{
  std::vector<std::filesystem::path> out;
  for (const auto & [file, ops] : by_file_) {
    if (!ops.empty()) {
      out.push_back(ops.front().target_file);
    }
  }
  return out;
}

}  // namespace php_refactor
