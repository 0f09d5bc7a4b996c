// reqtrace/graph/graph_json.hpp - JSON export of a finished graph
//
// Shape:
//   {
//     "nodes":       [{"id", "kind", "label", "source", "parents", "children", "data", "metrics"}],
//     "edges":       [{"parent", "child", "relationship"}],
//     "roots":       ["REQ-p00001", ...],
//     "conflicts":   [{"id", "source"}],
//     "diagnostics": [{"severity", "check", "node", "message", "location"}]
//   }
//
#pragma once

#include <nlohmann/json.hpp>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Serialize the graph, its roots, conflicts and diagnostics.
 *
 * Nodes are referenced by their identifier text. Conflict nodes appear only
 * in "conflicts". Relationship names come from `schema`.
 */
[[nodiscard]] nlohmann::json graph_to_json(const TraceGraph & graph, const GraphSchema & schema);

[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic & diag);

[[nodiscard]] nlohmann::json metrics_to_json(const RollupMetrics & metrics);

}  // namespace reqtrace
