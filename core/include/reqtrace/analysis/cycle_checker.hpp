// reqtrace/analysis/cycle_checker.hpp - Cycle detection over rollup edges
//
// Rollup relationships must form a DAG. A cycle makes coverage undefined, so
// each back-edge is reported with the full path that closes it.
//
#pragma once

#include <cstddef>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Three-color depth-first search over the edges of rollup relationships,
 * driven by an explicit stack of (node, next edge) frames.
 *
 * Every non-conflict node is a starting point, so cycles that no root can
 * reach are found too.
 */
class CycleChecker
{
public:
  explicit CycleChecker(const GraphSchema & schema, DiagnosticBag * diags = nullptr)
  : schema_(schema), diags_(diags)
  {
  }

  /// @return true if no cycle was found
  bool check(const TraceGraph & graph);

  [[nodiscard]] size_t cycle_count() const noexcept { return cycleCount_; }

private:
  const GraphSchema & schema_;
  DiagnosticBag * diags_ = nullptr;
  size_t cycleCount_ = 0;
};

}  // namespace reqtrace
