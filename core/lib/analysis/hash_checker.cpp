// reqtrace/analysis/hash_checker.cpp - Stored content hash verification

#include "reqtrace/analysis/hash_checker.hpp"

#include <string>

namespace reqtrace
{

bool HashChecker::check(const TraceGraph & graph)
{
  mismatchCount_ = 0;
  const ValidationConfig & v = schema_.validation;

  for (const NodeId id : graph.nodes_by_kind(NodeKind::Requirement)) {
    const GraphNode & n = graph.node(id);
    const auto * req = n.as<Requirement>();

    if (!req->stored_hash) {
      if (v.require_hash && diags_) {
        auto builder = diags_->report_warning("requirement " + n.key + " has no stored hash");
        builder.with_code("hash-missing").with_node(n.key).with_help(
          "add '| **Hash**: " + req->computed_hash + "' to the end marker");
        if (n.location.is_valid()) {
          builder.at(n.location);
        }
      }
      continue;
    }

    if (req->hash_matches()) {
      continue;
    }

    ++mismatchCount_;
    if (!diags_) {
      continue;
    }
    const Severity severity = v.strict_hash ? Severity::Error : Severity::Info;
    auto builder = diags_->report(
      severity, "requirement " + n.key + " changed since it was hashed (stored " +
                  *req->stored_hash + ", computed " + req->computed_hash + ")");
    builder.with_code("hash-mismatch")
      .with_node(n.key)
      .with_help("review dependent requirements, then update the hash to " + req->computed_hash);
    if (req->location.end_line) {
      SourceLocation end = req->location;
      end.line = *req->location.end_line;
      end.end_line.reset();
      builder.at(end);
    } else if (n.location.is_valid()) {
      builder.at(n.location);
    }
  }

  return mismatchCount_ == 0;
}

}  // namespace reqtrace
