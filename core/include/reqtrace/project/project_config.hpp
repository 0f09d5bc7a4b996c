// reqtrace/project/project_config.hpp - Project configuration (reqtrace.yaml)
//
// Parses reqtrace.yaml into identifier settings, document discovery rules
// and a GraphSchema. The core never reads this file; callers pass the
// resulting schema to build_graph().
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "reqtrace/basic/logging.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/syntax/identifier.hpp"

namespace reqtrace
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Document discovery section.
 */
struct DocumentsConfig
{
  /// Directories to scan, relative to the project root
  std::vector<std::filesystem::path> dirs = {"spec"};

  /// File extensions to parse (with the leading dot)
  std::vector<std::string> extensions = {".md"};

  /// File or directory names to skip anywhere below `dirs`
  std::vector<std::string> exclude;
};

struct BuildConfig
{
  /// Parse documents on parallel workers
  bool parallel_parse = true;
};

/**
 * Complete project configuration (reqtrace.yaml).
 */
struct ProjectConfig
{
  std::string name;
  IdentifierConfig identifiers;
  DocumentsConfig documents;

  /// JSON file with code, test, result and journey records
  std::optional<std::filesystem::path> records;

  GraphSchema schema = default_schema();
  LoggingConfig logging;
  BuildConfig build;

  /// Directory containing reqtrace.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a reqtrace.yaml file.
 *
 * Missing sections keep their defaults. Unknown keys are ignored.
 *
 * @param config_path Path to reqtrace.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to reqtrace.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "reqtrace.yaml";

}  // namespace reqtrace
