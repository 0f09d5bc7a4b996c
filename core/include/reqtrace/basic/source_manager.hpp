// reqtrace/basic/source_manager.hpp - Source files, locations and the source registry
//
// Documents are addressed by path and 1-based line. The registry keeps the
// text of every document read during a build so diagnostics can show the
// offending line.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reqtrace
{

namespace fs = std::filesystem;

// ============================================================================
// SourceLocation - Document path and line span
// ============================================================================

/**
 * Position of an element in a source document.
 *
 * Lines are 1-indexed. A location with line 0 is unknown.
 */
struct SourceLocation
{
  std::string path;
  uint32_t line = 0;
  std::optional<uint32_t> end_line;

  [[nodiscard]] bool is_valid() const noexcept { return line > 0; }

  /// "path:line" or "path:line-end_line"
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const SourceLocation & other) const noexcept
  {
    return path == other.path && line == other.line && end_line == other.end_line;
  }
  [[nodiscard]] bool operator!=(const SourceLocation & other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// FileId - Registry handle
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceFile - Content plus line table
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  /// Number of lines (a trailing newline does not start a new line)
  [[nodiscard]] size_t line_count() const noexcept;

  /// Content of a line (0-indexed) without its line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

private:
  void build_line_table();

  fs::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - All documents of one build
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Register a file. Registering the same path twice returns the existing id.
  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find_by_path(const fs::path & path) const;

  /// Look up a file by the path string stored in a SourceLocation
  [[nodiscard]] const SourceFile * find_file(std::string_view path) const;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  /// Paths are compared in normal form with '/' separators
  [[nodiscard]] static std::string normalize_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace reqtrace
