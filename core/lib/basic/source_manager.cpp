// reqtrace/basic/source_manager.cpp - Source file and registry implementation
#include "reqtrace/basic/source_manager.hpp"

#include <utility>

namespace reqtrace
{

std::string SourceLocation::to_string() const
{
  std::string out = path.empty() ? std::string("<unknown>") : path;
  if (line == 0) {
    return out;
  }
  out += ':';
  out += std::to_string(line);
  if (end_line && *end_line != line) {
    out += '-';
    out += std::to_string(*end_line);
  }
  return out;
}

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  build_line_table();
}

size_t SourceFile::line_count() const noexcept
{
  if (!content_.empty() && content_.back() == '\n') {
    return line_offsets_.size() - 1;
  }
  return line_offsets_.size();
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
  return path.lexically_normal().generic_string();
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(key, id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid()) {
    return nullptr;
  }
  const auto idx = static_cast<size_t>(id.value);
  if (idx >= files_.size()) {
    return nullptr;
  }
  return files_[idx].get();
}

std::optional<FileId> SourceRegistry::find_by_path(const fs::path & path) const
{
  const std::string key = normalize_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    return it->second;
  }
  return std::nullopt;
}

const SourceFile * SourceRegistry::find_file(std::string_view path) const
{
  if (path.empty()) {
    return nullptr;
  }
  const auto id = find_by_path(fs::path(std::string(path)));
  if (!id) {
    return nullptr;
  }
  return get_file(*id);
}

}  // namespace reqtrace
