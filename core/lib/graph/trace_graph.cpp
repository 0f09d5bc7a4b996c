// reqtrace/graph/trace_graph.cpp - Traceability graph implementation

#include "reqtrace/graph/trace_graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace reqtrace
{

bool RollupMetrics::operator==(const RollupMetrics & other) const noexcept
{
  return total_assertions == other.total_assertions &&
         covered_assertions == other.covered_assertions &&
         direct_covered == other.direct_covered && explicit_covered == other.explicit_covered &&
         inferred_covered == other.inferred_covered && uncovered == other.uncovered &&
         total_tests == other.total_tests && passed_tests == other.passed_tests &&
         failed_tests == other.failed_tests && skipped_tests == other.skipped_tests &&
         unknown_tests == other.unknown_tests && total_code_refs == other.total_code_refs &&
         total_requirements == other.total_requirements && coverage_pct == other.coverage_pct &&
         pass_rate_pct == other.pass_rate_pct;
}

// ============================================================================
// NodeWalk
// ============================================================================

NodeWalk::iterator::iterator(
  const TraceGraph * graph, const std::vector<NodeId> & starts, Order order)
: graph_(graph), order_(order), starts_(starts)
{
  if (!graph_) {
    return;
  }
  visited_.assign(graph_->node_count(), false);
  advance();
}

NodeWalk::iterator::reference NodeWalk::iterator::operator*() const
{
  return graph_->node(current_);
}

NodeWalk::iterator & NodeWalk::iterator::operator++()
{
  advance();
  return *this;
}

NodeWalk::iterator NodeWalk::iterator::operator++(int)
{
  iterator prev = *this;
  advance();
  return prev;
}

bool NodeWalk::iterator::enterable(NodeId id) const
{
  if (!id.is_valid() || id.value >= visited_.size() || visited_[id.value]) {
    return false;
  }
  return !graph_->node(id).conflict;
}

void NodeWalk::iterator::advance()
{
  switch (order_) {
    case Order::PreOrder:
      advance_pre();
      break;
    case Order::PostOrder:
      advance_post();
      break;
    case Order::LevelOrder:
      advance_level();
      break;
  }
}

void NodeWalk::iterator::advance_pre()
{
  for (;;) {
    if (stack_.empty()) {
      if (next_start_ >= starts_.size()) {
        current_ = NodeId::invalid();
        return;
      }
      stack_.push_back(starts_[next_start_++]);
    }

    const NodeId id = stack_.back();
    stack_.pop_back();
    if (!enterable(id)) {
      continue;
    }
    visited_[id.value] = true;

    // Reverse push so the first child is visited first
    const auto & child_edges = graph_->node(id).child_edges;
    for (auto it = child_edges.rbegin(); it != child_edges.rend(); ++it) {
      const NodeId child = graph_->edge(*it).child;
      if (enterable(child)) {
        stack_.push_back(child);
      }
    }
    current_ = id;
    return;
  }
}

void NodeWalk::iterator::advance_post()
{
  for (;;) {
    if (post_stack_.empty()) {
      while (next_start_ < starts_.size() && !enterable(starts_[next_start_])) {
        ++next_start_;
      }
      if (next_start_ >= starts_.size()) {
        current_ = NodeId::invalid();
        return;
      }
      const NodeId start = starts_[next_start_++];
      visited_[start.value] = true;
      post_stack_.emplace_back(start, 0);
    }

    auto & [id, next_edge] = post_stack_.back();
    const auto & child_edges = graph_->node(id).child_edges;
    if (next_edge < child_edges.size()) {
      const NodeId child = graph_->edge(child_edges[next_edge]).child;
      ++next_edge;
      if (enterable(child)) {
        visited_[child.value] = true;
        post_stack_.emplace_back(child, 0);
      }
      continue;
    }

    current_ = id;
    post_stack_.pop_back();
    return;
  }
}

void NodeWalk::iterator::advance_level()
{
  if (queue_.empty()) {
    while (next_start_ < starts_.size() && !enterable(starts_[next_start_])) {
      ++next_start_;
    }
    if (next_start_ >= starts_.size()) {
      current_ = NodeId::invalid();
      return;
    }
    const NodeId start = starts_[next_start_++];
    visited_[start.value] = true;
    queue_.push_back(start);
  }

  const NodeId id = queue_.front();
  queue_.pop_front();
  for (const size_t e : graph_->node(id).child_edges) {
    const NodeId child = graph_->edge(e).child;
    if (enterable(child)) {
      visited_[child.value] = true;
      queue_.push_back(child);
    }
  }
  current_ = id;
}

std::vector<NodeId> NodeWalk::ids() const
{
  std::vector<NodeId> out;
  for (const GraphNode & n : *this) {
    out.push_back(n.id);
  }
  return out;
}

// ============================================================================
// TraceGraph - construction
// ============================================================================

void TraceGraph::check_mutable() const
{
  if (frozen_) {
    throw std::logic_error("trace graph is frozen");
  }
}

GraphNode & TraceGraph::mutable_node(NodeId id)
{
  check_mutable();
  return nodes_.at(id.value);
}

NodeId TraceGraph::add_node(
  std::string key, NodePayload payload, std::string label, SourceLocation location)
{
  check_mutable();
  GraphNode n;
  n.id = NodeId{static_cast<uint32_t>(nodes_.size())};
  n.key = std::move(key);
  n.label = std::move(label);
  n.location = std::move(location);
  n.payload = std::move(payload);
  nodes_.push_back(std::move(n));
  return nodes_.back().id;
}

bool TraceGraph::link(NodeId parent, NodeId child, size_t relationship)
{
  check_mutable();
  // Validate both endpoints before touching any state
  (void)nodes_.at(parent.value);
  (void)nodes_.at(child.value);

  if (!edge_keys_.emplace(parent.value, child.value, relationship).second) {
    return false;
  }

  const size_t index = edges_.size();
  edges_.push_back(Edge{parent, child, relationship});
  nodes_[parent.value].child_edges.push_back(index);
  nodes_[child.value].parent_edges.push_back(index);
  return true;
}

bool TraceGraph::index(const std::string & key, NodeId id)
{
  check_mutable();
  return index_.emplace(key, id).second;
}

void TraceGraph::mark_conflict(NodeId id)
{
  GraphNode & n = mutable_node(id);
  if (!n.conflict) {
    n.conflict = true;
    conflicts_.push_back(id);
  }
}

void TraceGraph::set_roots(std::vector<NodeId> roots)
{
  check_mutable();
  roots_ = std::move(roots);
}

void TraceGraph::set_metrics(NodeId id, RollupMetrics metrics)
{
  mutable_node(id).metrics = metrics;
}

// ============================================================================
// TraceGraph - access
// ============================================================================

namespace
{

std::vector<NodeId> distinct(std::vector<NodeId> ids)
{
  std::unordered_set<uint32_t> seen;
  std::vector<NodeId> out;
  out.reserve(ids.size());
  for (const NodeId id : ids) {
    if (seen.insert(id.value).second) {
      out.push_back(id);
    }
  }
  return out;
}

}  // namespace

std::vector<NodeId> TraceGraph::children(NodeId id) const
{
  std::vector<NodeId> out;
  for (const size_t e : node(id).child_edges) {
    out.push_back(edges_[e].child);
  }
  return distinct(std::move(out));
}

std::vector<NodeId> TraceGraph::parents(NodeId id) const
{
  std::vector<NodeId> out;
  for (const size_t e : node(id).parent_edges) {
    out.push_back(edges_[e].parent);
  }
  return distinct(std::move(out));
}

const GraphNode * TraceGraph::find_by_id(std::string_view key) const
{
  const auto id = lookup(key);
  return id ? &nodes_[id->value] : nullptr;
}

std::optional<NodeId> TraceGraph::lookup(std::string_view key) const
{
  const auto it = index_.find(std::string(key));
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<NodeId> TraceGraph::nodes_by_kind(NodeKind kind) const
{
  std::vector<NodeId> out;
  for (const GraphNode & n : nodes_) {
    if (!n.conflict && n.kind() == kind) {
      out.push_back(n.id);
    }
  }
  return out;
}

std::vector<NodeId> TraceGraph::ancestors(NodeId id) const
{
  std::vector<bool> visited(nodes_.size(), false);
  visited.at(id.value) = true;

  std::vector<NodeId> out;
  std::deque<NodeId> queue{id};
  while (!queue.empty()) {
    const NodeId cur = queue.front();
    queue.pop_front();
    for (const size_t e : nodes_[cur.value].parent_edges) {
      const NodeId p = edges_[e].parent;
      if (!visited[p.value]) {
        visited[p.value] = true;
        out.push_back(p);
        queue.push_back(p);
      }
    }
  }
  return out;
}

}  // namespace reqtrace
