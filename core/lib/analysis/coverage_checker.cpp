// reqtrace/analysis/coverage_checker.cpp - Coverage gap detection

#include "reqtrace/analysis/coverage_checker.hpp"

#include "reqtrace/analysis/coverage.hpp"

namespace reqtrace
{

bool CoverageChecker::check(const TraceGraph & graph)
{
  gapCount_ = 0;

  for (const NodeId id : graph.nodes_by_kind(NodeKind::Assertion)) {
    const GraphNode & n = graph.node(id);
    const auto * a = n.as<Assertion>();
    if (a->placeholder || a->expected_broken) {
      continue;
    }
    if (const auto owner = owner_of(graph, schema_, id)) {
      if (!contributes(graph.node(*owner), schema_.metrics)) {
        continue;
      }
    }

    const AssertionCoverage cov = classify_assertion(graph, schema_, id);
    if (cov.covered(schema_.metrics)) {
      continue;
    }

    ++gapCount_;
    if (!diags_) {
      continue;
    }
    auto builder = diags_->report_info("assertion " + n.key + " is not covered");
    builder.with_code("coverage-gap").with_node(n.key);
    if (n.location.is_valid()) {
      builder.at(n.location);
    }
    if (cov.inferred) {
      builder.with_help(
        "the owning requirement is implemented as a whole; reference " + n.key + " directly");
    }
  }

  return gapCount_ == 0;
}

}  // namespace reqtrace
