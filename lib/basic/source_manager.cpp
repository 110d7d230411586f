// filament/basic/source_manager.cpp - SourceFile and SourceRegistry
#include "filament/basic/source_manager.hpp"

#include <algorithm>

namespace filament
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

void SourceFile::build_line_table()
{
  line_offsets_.assign(1, 0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  const auto clamped = std::min<uint32_t>(offset, static_cast<uint32_t>(content_.size()));

  // First line start strictly greater than the offset; the line we want is the one before.
  const auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), clamped);
  const auto line_index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), it)) - 1;
  return {line_index + 1, clamped - line_offsets_[line_index] + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t begin = line_offsets_[line_index];
  uint32_t end = (line_index + 1 < line_offsets_.size()) ? line_offsets_[line_index + 1]
                                                         : static_cast<uint32_t>(content_.size());
  while (end > begin && (content_[end - 1] == '\n' || content_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(content_).substr(begin, end - begin);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const uint32_t begin = range.get_begin().offset();
  if (begin >= content_.size()) {
    return {};
  }
  const uint32_t end =
    std::min<uint32_t>(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  return std::string_view(content_).substr(begin, end > begin ? end - begin : 0);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange out;
  if (range.is_invalid()) {
    return out;
  }

  out.start_byte = range.get_begin().offset();
  out.end_byte = range.get_end().offset();

  const LineColumn start = get_line_column(out.start_byte);
  const LineColumn end = get_line_column(out.end_byte);
  out.start_line = start.line;
  out.start_column = start.column;
  out.end_line = end.line;
  out.end_column = end.column;
  return out;
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::normalize_key(const fs::path & path)
{
  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  return ec ? path.lexically_normal().string() : canonical.string();
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    return it->second;
  }
  if (files_.size() >= FileId::k_invalid) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(key, id);
  return id;
}

void SourceRegistry::update_content(FileId id, std::string new_content)
{
  if (id.is_valid() && id.value < files_.size()) {
    files_[id.value]->set_content(std::move(new_content));
  }
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_empty;
  const SourceFile * file = get_file(id);
  return file != nullptr ? file->path() : k_empty;
}

std::optional<FileId> SourceRegistry::find_by_path(const fs::path & path) const
{
  if (const auto it = path_to_id_.find(normalize_key(path)); it != path_to_id_.end()) {
    return it->second;
  }
  return std::nullopt;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const SourceFile * file = get_file(loc.file_id());
  return (file != nullptr && loc.is_valid()) ? file->get_line_column(loc.offset()) : LineColumn{};
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->get_slice(range) : std::string_view{};
}

}  // namespace filament
