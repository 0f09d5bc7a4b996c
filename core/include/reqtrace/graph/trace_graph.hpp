// reqtrace/graph/trace_graph.hpp - Traceability graph: node arena, edges, traversal
//
// Nodes live in an arena addressed by NodeId; edges are index lists on both
// endpoints. A node may have several parents (the graph is a DAG, not a
// tree). After the metrics pass the graph is frozen and safe to share across
// concurrent readers.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/node_kind.hpp"
#include "reqtrace/model/records.hpp"

namespace reqtrace
{

// ============================================================================
// NodeId
// ============================================================================

struct NodeId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  [[nodiscard]] static constexpr NodeId invalid() noexcept { return NodeId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(NodeId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(NodeId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(NodeId other) const noexcept
  {
    return value < other.value;
  }
};

// ============================================================================
// Payload / metrics / edges
// ============================================================================

/**
 * Typed node content. The active alternative determines the node kind
 * (alternatives are in NodeKind order).
 */
using NodePayload =
  std::variant<Requirement, Assertion, CodeReference, TestReference, TestResult, Journey>;

static_assert(std::variant_size_v<NodePayload> == k_node_kind_count);

/**
 * Aggregates over a node and its distinct rollup descendants.
 */
struct RollupMetrics
{
  uint32_t total_assertions = 0;
  uint32_t covered_assertions = 0;
  uint32_t direct_covered = 0;    // by a test or code reference
  uint32_t explicit_covered = 0;  // by a requirement implementing the assertion
  uint32_t inferred_covered = 0;  // by a requirement implementing the whole owner
  uint32_t uncovered = 0;

  uint32_t total_tests = 0;
  uint32_t passed_tests = 0;
  uint32_t failed_tests = 0;
  uint32_t skipped_tests = 0;
  uint32_t unknown_tests = 0;

  uint32_t total_code_refs = 0;
  uint32_t total_requirements = 0;

  double coverage_pct = 0.0;
  double pass_rate_pct = 0.0;

  [[nodiscard]] bool operator==(const RollupMetrics & other) const noexcept;
  [[nodiscard]] bool operator!=(const RollupMetrics & other) const noexcept
  {
    return !(*this == other);
  }
};

struct Edge
{
  NodeId parent;
  NodeId child;

  /// Index of the relationship row in the schema
  size_t relationship = 0;
};

struct GraphNode
{
  NodeId id;

  /// Identifier text used in the index (e.g. "REQ-p00001-A", "test:...")
  std::string key;

  std::string label;
  SourceLocation location;
  NodePayload payload;

  /// Indices into TraceGraph::edges()
  std::vector<size_t> parent_edges;
  std::vector<size_t> child_edges;

  /// Later claimant of an identifier; excluded from index, roots and traversal
  bool conflict = false;

  /// Set by the metrics pass
  std::optional<RollupMetrics> metrics;

  [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(payload.index()); }

  template <typename T>
  [[nodiscard]] const T * as() const noexcept
  {
    return std::get_if<T>(&payload);
  }
};

class TraceGraph;

// ============================================================================
// NodeWalk - Lazy, restartable traversal
// ============================================================================

/**
 * A traversal over the graph starting at one or more nodes.
 *
 * Each begin() starts an independent walk with its own stack/queue and
 * visited set, so the same NodeWalk can be iterated any number of times.
 * Every node is yielded at most once per walk, even when it is reachable
 * through several parents. Conflict nodes are never yielded.
 */
class NodeWalk
{
public:
  enum class Order : uint8_t {
    PreOrder,
    PostOrder,
    LevelOrder,
  };

  class iterator
  {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = GraphNode;
    using difference_type = std::ptrdiff_t;
    using pointer = const GraphNode *;
    using reference = const GraphNode &;

    iterator() = default;
    iterator(const TraceGraph * graph, const std::vector<NodeId> & starts, Order order);

    [[nodiscard]] reference operator*() const;
    [[nodiscard]] pointer operator->() const { return &**this; }

    iterator & operator++();
    iterator operator++(int);

    [[nodiscard]] bool operator==(const iterator & other) const noexcept
    {
      return current_ == other.current_;
    }
    [[nodiscard]] bool operator!=(const iterator & other) const noexcept
    {
      return !(*this == other);
    }

  private:
    void advance();
    void advance_pre();
    void advance_post();
    void advance_level();
    [[nodiscard]] bool enterable(NodeId id) const;

    const TraceGraph * graph_ = nullptr;
    Order order_ = Order::PreOrder;
    NodeId current_;
    std::vector<bool> visited_;
    std::vector<NodeId> starts_;
    size_t next_start_ = 0;
    std::vector<NodeId> stack_;                           // pre-order
    std::vector<std::pair<NodeId, size_t>> post_stack_;  // post-order: node, next child edge
    std::deque<NodeId> queue_;                            // level-order
  };

  NodeWalk(const TraceGraph & graph, std::vector<NodeId> starts, Order order)
  : graph_(&graph), starts_(std::move(starts)), order_(order)
  {
  }

  [[nodiscard]] iterator begin() const { return iterator(graph_, starts_, order_); }
  [[nodiscard]] iterator end() const { return iterator(); }

  [[nodiscard]] std::vector<NodeId> ids() const;

private:
  const TraceGraph * graph_;
  std::vector<NodeId> starts_;
  Order order_;
};

// ============================================================================
// TraceGraph
// ============================================================================

class TraceGraph
{
public:
  TraceGraph() = default;

  TraceGraph(const TraceGraph &) = delete;
  TraceGraph & operator=(const TraceGraph &) = delete;
  TraceGraph(TraceGraph &&) = default;
  TraceGraph & operator=(TraceGraph &&) = default;

  // ===========================================================================
  // Construction (builder and metrics pass only)
  // ===========================================================================

  NodeId add_node(std::string key, NodePayload payload, std::string label, SourceLocation location);

  /**
   * Link parent -> child under a relationship row.
   *
   * Idempotent: linking the same (parent, child, relationship) twice is a
   * no-op and returns false.
   */
  bool link(NodeId parent, NodeId child, size_t relationship);

  /// Index a node under `key`; returns false if the key is already taken
  bool index(const std::string & key, NodeId id);

  void mark_conflict(NodeId id);
  void set_roots(std::vector<NodeId> roots);
  void set_metrics(NodeId id, RollupMetrics metrics);

  /// Make the graph read-only; later mutation throws std::logic_error
  void freeze() noexcept { frozen_ = true; }
  [[nodiscard]] bool frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Access
  // ===========================================================================

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

  /// @throws std::out_of_range for an unknown id
  [[nodiscard]] const GraphNode & node(NodeId id) const { return nodes_.at(id.value); }

  [[nodiscard]] const std::vector<GraphNode> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const std::vector<Edge> & edges() const noexcept { return edges_; }
  [[nodiscard]] const Edge & edge(size_t index) const { return edges_.at(index); }

  [[nodiscard]] std::vector<NodeId> children(NodeId id) const;
  [[nodiscard]] std::vector<NodeId> parents(NodeId id) const;

  [[nodiscard]] const std::vector<NodeId> & roots() const noexcept { return roots_; }

  /// Later claimants of duplicate identifiers, in input order
  [[nodiscard]] const std::vector<NodeId> & conflicts() const noexcept { return conflicts_; }

  [[nodiscard]] const GraphNode * find_by_id(std::string_view key) const;
  [[nodiscard]] std::optional<NodeId> lookup(std::string_view key) const;

  /// Non-conflict nodes of one kind, in creation order
  [[nodiscard]] std::vector<NodeId> nodes_by_kind(NodeKind kind) const;

  // ===========================================================================
  // Traversal
  // ===========================================================================

  [[nodiscard]] NodeWalk pre_order() const { return {*this, roots_, NodeWalk::Order::PreOrder}; }
  [[nodiscard]] NodeWalk pre_order(NodeId start) const
  {
    return {*this, {start}, NodeWalk::Order::PreOrder};
  }
  [[nodiscard]] NodeWalk post_order() const
  {
    return {*this, roots_, NodeWalk::Order::PostOrder};
  }
  [[nodiscard]] NodeWalk post_order(NodeId start) const
  {
    return {*this, {start}, NodeWalk::Order::PostOrder};
  }
  [[nodiscard]] NodeWalk level_order() const
  {
    return {*this, roots_, NodeWalk::Order::LevelOrder};
  }
  [[nodiscard]] NodeWalk level_order(NodeId start) const
  {
    return {*this, {start}, NodeWalk::Order::LevelOrder};
  }

  /// All distinct ancestors of `id` in breadth-first order (excluding `id`)
  [[nodiscard]] std::vector<NodeId> ancestors(NodeId id) const;

  /**
   * First node matching `pred`: pre-order from the roots, then any
   * non-conflict node unreachable from them.
   */
  template <typename Pred>
  [[nodiscard]] const GraphNode * find_if(Pred pred) const
  {
    for (const GraphNode & n : pre_order()) {
      if (pred(n)) {
        return &n;
      }
    }
    for (const GraphNode & n : nodes_) {
      if (!n.conflict && pred(n)) {
        return &n;
      }
    }
    return nullptr;
  }

  // ===========================================================================
  // Diagnostics
  // ===========================================================================

  [[nodiscard]] ValidationResult & diagnostics() noexcept { return diagnostics_; }
  [[nodiscard]] const ValidationResult & diagnostics() const noexcept { return diagnostics_; }

private:
  void check_mutable() const;
  GraphNode & mutable_node(NodeId id);

  std::vector<GraphNode> nodes_;
  std::vector<Edge> edges_;
  std::set<std::tuple<uint32_t, uint32_t, size_t>> edge_keys_;
  std::unordered_map<std::string, NodeId> index_;
  std::vector<NodeId> roots_;
  std::vector<NodeId> conflicts_;
  ValidationResult diagnostics_;
  bool frozen_ = false;
};

}  // namespace reqtrace
