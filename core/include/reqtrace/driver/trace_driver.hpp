// reqtrace/driver/trace_driver.hpp - Trace pipeline driver
//
// Single entry point for discover -> parse -> build -> rollup.
// Used by the CLI; the core (parser, builder, metrics) never touches the
// filesystem itself.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/basic/source_manager.hpp"
#include "reqtrace/graph/trace_graph.hpp"
#include "reqtrace/project/project_config.hpp"

namespace reqtrace
{

// ============================================================================
// Trace Options
// ============================================================================

struct TraceOptions
{
  /// Record file (overrides project config)
  std::optional<std::filesystem::path> records;

  /// Parse documents in parallel (overrides project config)
  std::optional<bool> parallel_parse;

  /// Report hash mismatches as errors
  bool strict = false;
};

// ============================================================================
// Trace Result
// ============================================================================

struct TraceResult
{
  /// Whether the pipeline ran and produced no errors
  bool success = false;

  /// Set when the pipeline could not run (unreadable records, I/O failure)
  std::optional<std::string> fatal_error;

  /// Parse, record and graph diagnostics, in that order
  DiagnosticBag diagnostics;

  /// Document sources, for printing snippets
  SourceRegistry sources;

  /// The finished, frozen graph (absent after a fatal error)
  std::optional<TraceGraph> graph;

  /// Schema the graph was built with
  GraphSchema schema;

  size_t document_count = 0;
};

// ============================================================================
// TraceDriver
// ============================================================================

/**
 * Driver that orchestrates the trace pipeline.
 *
 * The pipeline consists of:
 * 1. Document discovery (sorted, filtered by extension and exclusions)
 * 2. Reading documents into the SourceRegistry
 * 3. Parsing (one task per document when parallel), merged in path order
 * 4. Loading external records and merging journeys
 * 5. Graph build and validation
 * 6. Metrics rollup
 */
class TraceDriver
{
public:
  /**
   * Find the documents a project configuration selects.
   *
   * @return Absolute paths in lexicographic order
   */
  [[nodiscard]] static std::vector<std::filesystem::path> discover_documents(
    const ProjectConfig & config);

  /**
   * Run the full pipeline for a project.
   *
   * @param config Project configuration (from reqtrace.yaml or defaults)
   * @param options Run options (may override config settings)
   */
  [[nodiscard]] static TraceResult run(const ProjectConfig & config, const TraceOptions & options);
};

}  // namespace reqtrace
