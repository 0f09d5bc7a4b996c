// reqtrace/analysis/cycle_checker.cpp - Rollup cycle detection

#include "reqtrace/analysis/cycle_checker.hpp"

#include <gsl/span>
#include <string>
#include <vector>

namespace reqtrace
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

std::string cycle_message(
  const TraceGraph & graph, gsl::span<const NodeId> stack, NodeId closing)
{
  std::string msg = "cycle in rollup relationships: ";

  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == closing) {
      break;
    }
  }
  if (start >= stack.size()) {
    start = 0;
  }

  for (size_t i = start; i < stack.size(); ++i) {
    if (i > start) msg += " -> ";
    msg += graph.node(stack[i]).key;
  }
  msg += " -> ";
  msg += graph.node(closing).key;
  return msg;
}

}  // namespace

bool CycleChecker::check(const TraceGraph & graph)
{
  cycleCount_ = 0;

  std::vector<Color> color(graph.node_count(), Color::White);
  std::vector<NodeId> stack;
  std::vector<size_t> next_edge;
  stack.reserve(64);
  next_edge.reserve(64);

  for (const GraphNode & start : graph.nodes()) {
    if (start.conflict || color[start.id.value] != Color::White) {
      continue;
    }
    color[start.id.value] = Color::Gray;
    stack.push_back(start.id);
    next_edge.push_back(0);

    while (!stack.empty()) {
      const NodeId u = stack.back();
      const auto & edges = graph.node(u).child_edges;
      if (next_edge.back() >= edges.size()) {
        color[u.value] = Color::Black;
        stack.pop_back();
        next_edge.pop_back();
        continue;
      }

      const Edge & edge = graph.edge(edges[next_edge.back()++]);
      if (!schema_.relationship(edge.relationship).rolls_up) {
        continue;
      }
      const NodeId v = edge.child;
      if (graph.node(v).conflict) {
        continue;
      }

      if (color[v.value] == Color::Gray) {
        ++cycleCount_;
        if (diags_) {
          const gsl::span<const NodeId> stack_view(stack.data(), stack.size());
          const GraphNode & closer = graph.node(u);
          auto builder = diags_->report_error(cycle_message(graph, stack_view, v));
          builder.with_code("cycle").with_node(graph.node(v).key);
          if (closer.location.is_valid()) {
            builder.at(closer.location);
          }
        }
        continue;
      }
      if (color[v.value] == Color::White) {
        color[v.value] = Color::Gray;
        stack.push_back(v);
        next_edge.push_back(0);
      }
    }
  }

  return cycleCount_ == 0;
}

}  // namespace reqtrace
