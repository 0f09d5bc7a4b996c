// reqtrace/graph/graph_builder.hpp - Build and validate the traceability graph
//
// The builder interprets the schema table row by row; it has no built-in
// knowledge of individual relationships. Structural problems never abort
// the build: they are collected in the graph's ValidationResult.
//
#pragma once

#include <vector>

#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"
#include "reqtrace/model/records.hpp"
#include "reqtrace/syntax/identifier.hpp"

namespace reqtrace
{

struct BuildInput
{
  std::vector<Requirement> requirements;
  std::vector<CodeReference> code_refs;
  std::vector<TestReference> test_refs;
  std::vector<TestResult> test_results;
  std::vector<Journey> journeys;
};

struct BuildOptions
{
  IdentifierConfig identifiers;
};

struct BuildResult
{
  TraceGraph graph;

  [[nodiscard]] const ValidationResult & diagnostics() const noexcept
  {
    return graph.diagnostics();
  }
};

/**
 * Build the graph from parsed requirements and external records, then run
 * the checks enabled in `schema.validation`.
 *
 * Metrics are not computed here; see compute_metrics().
 *
 * @throws SchemaError if the schema is malformed
 */
[[nodiscard]] BuildResult build_graph(
  const BuildInput & input, const GraphSchema & schema,
  const BuildOptions & options = BuildOptions{});

}  // namespace reqtrace
