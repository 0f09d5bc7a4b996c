// reqtrace/analysis/hash_checker.hpp - Stored content hash verification
#pragma once

#include <cstddef>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/graph/trace_graph.hpp"

namespace reqtrace
{

/**
 * Compare each requirement's stored hash with the hash of its current text.
 *
 * A mismatch is Info (Error with strict_hash). A missing hash is a Warning
 * only when require_hash is set.
 */
class HashChecker
{
public:
  explicit HashChecker(const GraphSchema & schema, DiagnosticBag * diags = nullptr)
  : schema_(schema), diags_(diags)
  {
  }

  /// @return true if no mismatch was found
  bool check(const TraceGraph & graph);

  [[nodiscard]] size_t mismatch_count() const noexcept { return mismatchCount_; }

private:
  const GraphSchema & schema_;
  DiagnosticBag * diags_ = nullptr;
  size_t mismatchCount_ = 0;
};

}  // namespace reqtrace
