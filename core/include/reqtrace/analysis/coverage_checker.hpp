// reqtrace/analysis/coverage_checker.hpp - Assertions nothing verifies
#pragma once

#include <cstddef>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Report uncovered assertions as Info.
 *
 * Placeholder and expected-broken assertions are exempt, as are assertions
 * whose owning requirement has an excluded status.
 */
class CoverageChecker
{
public:
  explicit CoverageChecker(const GraphSchema & schema, DiagnosticBag * diags = nullptr)
  : schema_(schema), diags_(diags)
  {
  }

  /// @return true if every checked assertion is covered
  bool check(const TraceGraph & graph);

  [[nodiscard]] size_t gap_count() const noexcept { return gapCount_; }

private:
  const GraphSchema & schema_;
  DiagnosticBag * diags_ = nullptr;
  size_t gapCount_ = 0;
};

}  // namespace reqtrace
