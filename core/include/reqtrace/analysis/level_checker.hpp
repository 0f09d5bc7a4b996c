// reqtrace/analysis/level_checker.hpp - Level hierarchy constraints
#pragma once

#include <cstddef>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Check every edge of a level-checked relationship against the schema's
 * level rules. An assertion parent counts at the level of its owner.
 */
class LevelChecker
{
public:
  explicit LevelChecker(const GraphSchema & schema, DiagnosticBag * diags = nullptr)
  : schema_(schema), diags_(diags)
  {
  }

  /// @return true if no edge violates the hierarchy
  bool check(const TraceGraph & graph);

  [[nodiscard]] size_t violation_count() const noexcept { return violationCount_; }

private:
  const GraphSchema & schema_;
  DiagnosticBag * diags_ = nullptr;
  size_t violationCount_ = 0;
};

}  // namespace reqtrace
