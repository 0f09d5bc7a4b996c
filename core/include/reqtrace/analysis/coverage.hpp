// reqtrace/analysis/coverage.hpp - How an assertion is covered
//
// Shared by the coverage-gap check and the metrics rollup so both agree on
// what "covered" means.
//
#pragma once

#include <cstdint>
#include <optional>

#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

struct AssertionCoverage
{
  /// A test or code reference validates the assertion
  bool direct = false;

  /// A requirement implements the assertion by label
  bool explicit_ref = false;

  /// A requirement implements the owning requirement as a whole
  bool inferred = false;

  [[nodiscard]] bool covered(const MetricsConfig & config) const noexcept
  {
    return direct || explicit_ref || (inferred && config.count_inferred_coverage);
  }
};

/// False for requirements whose status is excluded from rollup
[[nodiscard]] bool contributes(const GraphNode & node, const MetricsConfig & config) noexcept;

/// True if the edge belongs to a row that reads the Assertions field
[[nodiscard]] bool is_containment(const Edge & edge, const GraphSchema & schema);

/// Owning requirement of an assertion node, through its containment edge
[[nodiscard]] std::optional<NodeId> owner_of(
  const TraceGraph & graph, const GraphSchema & schema, NodeId assertion);

[[nodiscard]] AssertionCoverage classify_assertion(
  const TraceGraph & graph, const GraphSchema & schema, NodeId assertion);

}  // namespace reqtrace
