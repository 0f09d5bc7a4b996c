// reqtrace/analysis/metrics.cpp - Coverage and pass-rate rollup

#include "reqtrace/analysis/metrics.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include "reqtrace/analysis/coverage.hpp"

namespace reqtrace
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

using NodeSet = std::vector<uint32_t>;  // sorted, distinct

void merge_into(NodeSet & into, const NodeSet & from)
{
  NodeSet merged;
  merged.reserve(into.size() + from.size());
  std::set_union(into.begin(), into.end(), from.begin(), from.end(), std::back_inserter(merged));
  into = std::move(merged);
}

double percent(uint32_t part, uint32_t total) noexcept
{
  return total == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(total);
}

class MetricsPass
{
public:
  MetricsPass(TraceGraph & graph, const GraphSchema & schema)
  : graph_(graph), schema_(schema), config_(schema.metrics)
  {
  }

  void run()
  {
    if (graph_.frozen()) {
      throw std::logic_error("metrics already computed for this graph");
    }

    const size_t count = graph_.node_count();
    children_.assign(count, {});
    descendants_.assign(count, {});
    for (const GraphNode & n : graph_.nodes()) {
      if (!n.conflict) {
        children_[n.id.value] = rollup_children(n);
      }
    }

    compute_descendants();
    classify_leaves();

    for (const GraphNode & n : graph_.nodes()) {
      if (!n.conflict) {
        graph_.set_metrics(n.id, metrics_for(n.id));
      }
    }
    graph_.freeze();
  }

private:
  /// Distinct children through rollup edges that contribute to their parents
  [[nodiscard]] std::vector<uint32_t> rollup_children(const GraphNode & n) const
  {
    std::vector<uint32_t> out;
    for (const size_t e : n.child_edges) {
      const Edge & edge = graph_.edge(e);
      if (!schema_.relationship(edge.relationship).rolls_up) {
        continue;
      }
      if (!contributes(graph_.node(edge.child), config_)) {
        continue;
      }
      if (std::find(out.begin(), out.end(), edge.child.value) == out.end()) {
        out.push_back(edge.child.value);
      }
    }
    return out;
  }

  /**
   * Iterative post-order: D(N) is the union of {C} and D(C) over the
   * children C. A child still on the stack (gray) closes a cycle and is
   * skipped.
   */
  void compute_descendants()
  {
    std::vector<Color> color(graph_.node_count(), Color::White);
    std::vector<std::pair<uint32_t, size_t>> stack;

    for (const GraphNode & start : graph_.nodes()) {
      if (start.conflict || color[start.id.value] != Color::White) {
        continue;
      }
      color[start.id.value] = Color::Gray;
      stack.emplace_back(start.id.value, 0);

      while (!stack.empty()) {
        auto & [u, next] = stack.back();
        const auto & kids = children_[u];
        if (next < kids.size()) {
          const uint32_t c = kids[next++];
          if (color[c] == Color::White) {
            color[c] = Color::Gray;
            stack.emplace_back(c, 0);
          }
          continue;
        }

        NodeSet & d = descendants_[u];
        for (const uint32_t c : kids) {
          if (color[c] != Color::Black) {
            continue;
          }
          merge_into(d, NodeSet{c});
          merge_into(d, descendants_[c]);
        }
        d.erase(std::remove(d.begin(), d.end(), u), d.end());
        color[u] = Color::Black;
        stack.pop_back();
      }
    }
  }

  void classify_leaves()
  {
    coverage_.assign(graph_.node_count(), AssertionCoverage{});
    test_status_.assign(graph_.node_count(), TestStatus::Unknown);
    for (const GraphNode & n : graph_.nodes()) {
      if (n.conflict) {
        continue;
      }
      if (n.kind() == NodeKind::Assertion) {
        coverage_[n.id.value] = classify_assertion(graph_, schema_, n.id);
      } else if (n.kind() == NodeKind::Test) {
        test_status_[n.id.value] = rolled_up_status(graph_, n.id);
      }
    }
  }

  void count(uint32_t id, RollupMetrics & m) const
  {
    const GraphNode & n = graph_.node(NodeId{id});
    switch (n.kind()) {
      case NodeKind::Assertion: {
        const auto * a = n.as<Assertion>();
        if (a->placeholder && !config_.count_placeholder_assertions) {
          break;
        }
        ++m.total_assertions;
        const AssertionCoverage & cov = coverage_[id];
        if (cov.direct) {
          ++m.direct_covered;
        } else if (cov.explicit_ref) {
          ++m.explicit_covered;
        } else if (cov.inferred) {
          ++m.inferred_covered;
        }
        if (cov.covered(config_)) {
          ++m.covered_assertions;
        }
        break;
      }
      case NodeKind::Test:
        ++m.total_tests;
        switch (test_status_[id]) {
          case TestStatus::Passed:
            ++m.passed_tests;
            break;
          case TestStatus::Failed:
            ++m.failed_tests;
            break;
          case TestStatus::Skipped:
            ++m.skipped_tests;
            break;
          case TestStatus::Unknown:
            ++m.unknown_tests;
            break;
        }
        break;
      case NodeKind::Code:
        ++m.total_code_refs;
        break;
      case NodeKind::Requirement:
        ++m.total_requirements;
        break;
      case NodeKind::TestResult:
      case NodeKind::Journey:
        break;
    }
  }

  [[nodiscard]] RollupMetrics metrics_for(NodeId id) const
  {
    RollupMetrics m;
    count(id.value, m);
    for (const uint32_t d : descendants_[id.value]) {
      count(d, m);
    }
    m.uncovered = m.total_assertions - m.covered_assertions;
    m.coverage_pct = percent(m.covered_assertions, m.total_assertions);
    m.pass_rate_pct = percent(m.passed_tests, m.total_tests);
    return m;
  }

  TraceGraph & graph_;
  const GraphSchema & schema_;
  const MetricsConfig & config_;
  std::vector<std::vector<uint32_t>> children_;
  std::vector<NodeSet> descendants_;
  std::vector<AssertionCoverage> coverage_;
  std::vector<TestStatus> test_status_;
};

}  // namespace

TestStatus rolled_up_status(const TraceGraph & graph, NodeId test)
{
  bool passed = false;
  bool skipped = false;
  for (const size_t e : graph.node(test).child_edges) {
    const GraphNode & child = graph.node(graph.edge(e).child);
    if (child.conflict) {
      continue;
    }
    const auto * result = child.as<TestResult>();
    if (!result) {
      continue;
    }
    switch (result->status) {
      case TestStatus::Failed:
        return TestStatus::Failed;
      case TestStatus::Passed:
        passed = true;
        break;
      case TestStatus::Skipped:
        skipped = true;
        break;
      case TestStatus::Unknown:
        break;
    }
  }
  if (passed) return TestStatus::Passed;
  if (skipped) return TestStatus::Skipped;
  return TestStatus::Unknown;
}

void compute_metrics(TraceGraph & graph, const GraphSchema & schema)
{
  MetricsPass(graph, schema).run();
}

}  // namespace reqtrace
