// reqtrace/analysis/coverage.cpp - Assertion coverage classification

#include "reqtrace/analysis/coverage.hpp"

namespace reqtrace
{

bool contributes(const GraphNode & node, const MetricsConfig & config) noexcept
{
  if (node.conflict) {
    return false;
  }
  const auto * req = node.as<Requirement>();
  return req == nullptr || !config.excludes(req->status);
}

bool is_containment(const Edge & edge, const GraphSchema & schema)
{
  return schema.relationship(edge.relationship).field == TargetField::Assertions;
}

std::optional<NodeId> owner_of(const TraceGraph & graph, const GraphSchema & schema, NodeId assertion)
{
  for (const size_t e : graph.node(assertion).parent_edges) {
    const Edge & edge = graph.edge(e);
    if (is_containment(edge, schema)) {
      return edge.parent;
    }
  }
  return std::nullopt;
}

namespace
{

/// Non-containment rollup children that are allowed to contribute
template <typename Fn>
void for_each_covering_child(
  const TraceGraph & graph, const GraphSchema & schema, NodeId id, Fn fn)
{
  for (const size_t e : graph.node(id).child_edges) {
    const Edge & edge = graph.edge(e);
    if (!schema.relationship(edge.relationship).rolls_up || is_containment(edge, schema)) {
      continue;
    }
    const GraphNode & child = graph.node(edge.child);
    if (contributes(child, schema.metrics)) {
      fn(child);
    }
  }
}

}  // namespace

AssertionCoverage classify_assertion(
  const TraceGraph & graph, const GraphSchema & schema, NodeId assertion)
{
  AssertionCoverage cov;
  for_each_covering_child(graph, schema, assertion, [&cov](const GraphNode & child) {
    switch (child.kind()) {
      case NodeKind::Test:
      case NodeKind::Code:
        cov.direct = true;
        break;
      case NodeKind::Requirement:
        cov.explicit_ref = true;
        break;
      default:
        break;
    }
  });

  if (const auto owner = owner_of(graph, schema, assertion)) {
    for_each_covering_child(graph, schema, *owner, [&cov](const GraphNode & child) {
      if (child.kind() == NodeKind::Requirement) {
        cov.inferred = true;
      }
    });
  }
  return cov;
}

}  // namespace reqtrace
