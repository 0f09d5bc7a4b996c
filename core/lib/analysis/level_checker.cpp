// reqtrace/analysis/level_checker.cpp - Level hierarchy constraints

#include "reqtrace/analysis/level_checker.hpp"

#include <optional>
#include <string>

namespace reqtrace
{

namespace
{

std::optional<Level> level_of(const GraphNode & node)
{
  if (const auto * req = node.as<Requirement>()) {
    return req->level;
  }
  if (const auto * a = node.as<Assertion>()) {
    return a->owner.level;
  }
  return std::nullopt;
}

}  // namespace

bool LevelChecker::check(const TraceGraph & graph)
{
  violationCount_ = 0;

  for (const Edge & edge : graph.edges()) {
    const RelationshipSpec & rel = schema_.relationship(edge.relationship);
    if (!rel.level_checked) {
      continue;
    }

    const GraphNode & child = graph.node(edge.child);
    const GraphNode & parent = graph.node(edge.parent);
    const auto child_level = level_of(child);
    const auto parent_level = level_of(parent);
    if (!child_level || !parent_level || schema_.level_allowed(*child_level, *parent_level)) {
      continue;
    }

    ++violationCount_;
    if (!diags_) {
      continue;
    }

    std::string allowed;
    const auto it = schema_.level_rules.find(*child_level);
    if (it != schema_.level_rules.end()) {
      for (const Level l : it->second) {
        if (!allowed.empty()) allowed += ", ";
        allowed += std::string(to_string(l));
      }
    }

    auto builder = diags_->report_error(
      child.key + " (" + std::string(to_string(*child_level)) + ") " + rel.name + " " +
      parent.key + " (" + std::string(to_string(*parent_level)) + ")");
    builder.with_code("level-constraint").with_node(child.key);
    if (child.location.is_valid()) {
      builder.at(child.location);
    }
    if (allowed.empty()) {
      builder.with_help(std::string(to_string(*child_level)) + " requirements may not reference other requirements");
    } else {
      builder.with_help(std::string(to_string(*child_level)) + " requirements may reference: " + allowed);
    }
  }

  return violationCount_ == 0;
}

}  // namespace reqtrace
