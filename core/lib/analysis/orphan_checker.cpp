// reqtrace/analysis/orphan_checker.cpp - Orphan detection

#include "reqtrace/analysis/orphan_checker.hpp"

#include <string>

namespace reqtrace
{

bool OrphanChecker::exempt(const GraphNode & node) const noexcept
{
  if (schema_.is_root_kind(node.kind()) || !schema_.requires_parent(node.kind())) {
    return true;
  }
  if (const auto * req = node.as<Requirement>()) {
    return schema_.is_root_level(req->level);
  }
  return false;
}

bool OrphanChecker::check(const TraceGraph & graph)
{
  orphanCount_ = 0;

  for (const GraphNode & n : graph.nodes()) {
    if (n.conflict || !n.parent_edges.empty() || exempt(n)) {
      continue;
    }

    ++orphanCount_;
    if (!diags_) {
      continue;
    }

    std::string msg = std::string(to_string(n.kind())) + " " + n.key + " has no parent";
    std::string help;
    if (const auto * req = n.as<Requirement>()) {
      help = std::string(to_string(req->level)) +
             " requirements must implement a higher-level requirement";
    } else if (n.kind() == NodeKind::TestResult) {
      help = "the result does not belong to a known test";
    } else {
      help = "add a reference to the requirement it verifies";
    }

    auto builder = diags_->report_warning(std::move(msg));
    builder.with_code("orphan").with_node(n.key).with_help(std::move(help));
    if (n.location.is_valid()) {
      builder.at(n.location);
    }
  }

  return orphanCount_ == 0;
}

}  // namespace reqtrace
