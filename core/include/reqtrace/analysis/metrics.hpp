// reqtrace/analysis/metrics.hpp - Coverage and pass-rate rollup
//
// Counts for a node are taken over the node itself plus the set of distinct
// nodes reachable through rollup edges. A descendant reachable along several
// paths is counted once.
//
#pragma once

#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Attach RollupMetrics to every non-conflict node, then freeze the graph.
 *
 * Uses the schema's rollup rows and its MetricsConfig. Back-edges of cycles
 * are skipped (cycles are reported by the builder).
 *
 * @throws std::logic_error if the graph is already frozen
 */
void compute_metrics(TraceGraph & graph, const GraphSchema & schema);

/// Status of a test: failed > passed > skipped > unknown over its results
[[nodiscard]] TestStatus rolled_up_status(const TraceGraph & graph, NodeId test);

}  // namespace reqtrace
