// reqtrace/analysis/orphan_checker.hpp - Nodes missing a mandatory parent
#pragma once

#include <cstddef>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Report nodes that have no parent although some required relationship could
 * give their kind one.
 *
 * Root kinds and requirements at root levels are exempt.
 */
class OrphanChecker
{
public:
  explicit OrphanChecker(const GraphSchema & schema, DiagnosticBag * diags = nullptr)
  : schema_(schema), diags_(diags)
  {
  }

  /// @return true if no orphan was found
  bool check(const TraceGraph & graph);

  [[nodiscard]] size_t orphan_count() const noexcept { return orphanCount_; }

private:
  [[nodiscard]] bool exempt(const GraphNode & node) const noexcept;

  const GraphSchema & schema_;
  DiagnosticBag * diags_ = nullptr;
  size_t orphanCount_ = 0;
};

}  // namespace reqtrace
