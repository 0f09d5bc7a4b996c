// reqtrace/graph/schema.cpp - Relationship table and hierarchy rules
#include "reqtrace/graph/schema.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace reqtrace
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

template <typename T>
bool contains(const std::vector<T> & v, const T & value)
{
  return std::find(v.begin(), v.end(), value) != v.end();
}

RelationshipSpec row(
  std::string name, std::vector<NodeKind> sources, std::vector<NodeKind> targets,
  Direction direction, TargetField field, bool rolls_up, bool required, bool level_checked)
{
  RelationshipSpec spec;
  spec.name = std::move(name);
  spec.source_kinds = std::move(sources);
  spec.target_kinds = std::move(targets);
  spec.direction = direction;
  spec.field = field;
  spec.rolls_up = rolls_up;
  spec.required_for_non_root = required;
  spec.level_checked = level_checked;
  return spec;
}

}  // namespace

std::string_view to_string(TargetField field) noexcept
{
  switch (field) {
    case TargetField::Assertions:
      return "assertions";
    case TargetField::Implements:
      return "implements";
    case TargetField::Refines:
      return "refines";
    case TargetField::Addresses:
      return "addresses";
    case TargetField::Validates:
      return "validates";
    case TargetField::TestOf:
      return "test_of";
    case TargetField::JourneyAddresses:
      return "journey_addresses";
  }
  return "unknown";
}

std::string_view to_string(Direction direction) noexcept
{
  return direction == Direction::Up ? "up" : "down";
}

bool field_available(TargetField field, NodeKind kind) noexcept
{
  switch (field) {
    case TargetField::Assertions:
    case TargetField::Implements:
    case TargetField::Refines:
    case TargetField::Addresses:
      return kind == NodeKind::Requirement;
    case TargetField::Validates:
      return kind == NodeKind::Code || kind == NodeKind::Test;
    case TargetField::TestOf:
      return kind == NodeKind::TestResult;
    case TargetField::JourneyAddresses:
      return kind == NodeKind::Journey;
  }
  return false;
}

// ============================================================================
// RelationshipSpec / MetricsConfig
// ============================================================================

bool RelationshipSpec::accepts_source(NodeKind kind) const noexcept
{
  return contains(source_kinds, kind);
}

bool RelationshipSpec::accepts_target(NodeKind kind) const noexcept
{
  return contains(target_kinds, kind);
}

bool MetricsConfig::excludes(Status status) const noexcept
{
  return contains(exclude_status, status);
}

LevelRule parse_level_rule(std::string_view text)
{
  const size_t arrow = text.find("->");
  if (arrow == std::string_view::npos) {
    throw SchemaError("level rule '" + std::string(text) + "' has no '->'");
  }

  LevelRule rule;
  const auto child = parse_level(trim(text.substr(0, arrow)));
  if (!child) {
    throw SchemaError("level rule '" + std::string(text) + "' names an unknown level");
  }
  rule.child = *child;

  std::string_view rest = text.substr(arrow + 2);
  while (!rest.empty()) {
    const size_t comma = rest.find(',');
    const std::string_view part = trim(rest.substr(0, comma));
    if (!part.empty()) {
      const auto parent = parse_level(part);
      if (!parent) {
        throw SchemaError(
          "level rule '" + std::string(text) + "' names unknown level '" + std::string(part) +
          "'");
      }
      rule.parents.push_back(*parent);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  return rule;
}

// ============================================================================
// GraphSchema
// ============================================================================

void GraphSchema::validate() const
{
  std::set<std::string> names;
  for (const auto & rel : relationships) {
    if (rel.name.empty()) {
      throw SchemaError("relationship with an empty name");
    }
    if (!names.insert(rel.name).second) {
      throw SchemaError("duplicate relationship '" + rel.name + "'");
    }
    if (rel.source_kinds.empty() || rel.target_kinds.empty()) {
      throw SchemaError("relationship '" + rel.name + "' has no source or target kinds");
    }
    for (const auto kinds : {&rel.source_kinds, &rel.target_kinds}) {
      for (const NodeKind kind : *kinds) {
        if (!is_valid(kind)) {
          throw SchemaError(
            "relationship '" + rel.name + "' names unknown node kind " +
            std::to_string(static_cast<int>(kind)));
        }
      }
    }
    for (const NodeKind kind : rel.source_kinds) {
      if (!field_available(rel.field, kind)) {
        throw SchemaError(
          "relationship '" + rel.name + "': field '" + std::string(to_string(rel.field)) +
          "' is not carried by " + std::string(to_string(kind)) + " nodes");
      }
    }
  }
  for (const NodeKind kind : root_kinds) {
    if (!is_valid(kind)) {
      throw SchemaError("root kinds name unknown node kind " + std::to_string(static_cast<int>(kind)));
    }
  }
}

size_t GraphSchema::relationship_index(std::string_view name) const
{
  for (size_t i = 0; i < relationships.size(); ++i) {
    if (relationships[i].name == name) {
      return i;
    }
  }
  throw SchemaError("unknown relationship '" + std::string(name) + "'");
}

const RelationshipSpec * GraphSchema::find_relationship(std::string_view name) const noexcept
{
  for (const auto & rel : relationships) {
    if (rel.name == name) {
      return &rel;
    }
  }
  return nullptr;
}

bool GraphSchema::level_allowed(Level child, Level parent) const
{
  if (level_rules.empty()) {
    return true;
  }
  const auto it = level_rules.find(child);
  return it != level_rules.end() && contains(it->second, parent);
}

bool GraphSchema::is_root_kind(NodeKind kind) const noexcept { return contains(root_kinds, kind); }

bool GraphSchema::is_root_level(Level level) const noexcept
{
  return contains(root_levels, level);
}

bool GraphSchema::requires_parent(NodeKind kind) const noexcept
{
  return std::any_of(relationships.begin(), relationships.end(), [kind](const auto & rel) {
    return rel.required_for_non_root && contains(rel.child_kinds(), kind);
  });
}

void GraphSchema::add_level_rule(const LevelRule & rule)
{
  auto & parents = level_rules[rule.child];
  for (const Level p : rule.parents) {
    if (!contains(parents, p)) {
      parents.push_back(p);
    }
  }
}

GraphSchema default_schema()
{
  using K = NodeKind;
  GraphSchema schema;
  schema.relationships = {
    row(
      "contains", {K::Requirement}, {K::Assertion}, Direction::Down, TargetField::Assertions,
      true, false, false),
    row(
      "implements", {K::Requirement}, {K::Requirement, K::Assertion}, Direction::Up,
      TargetField::Implements, true, true, true),
    row(
      "refines", {K::Requirement}, {K::Requirement, K::Assertion}, Direction::Up,
      TargetField::Refines, false, false, true),
    row(
      "addresses", {K::Requirement}, {K::Journey}, Direction::Up, TargetField::Addresses, false,
      true, false),
    row(
      "validates", {K::Code, K::Test}, {K::Requirement, K::Assertion}, Direction::Up,
      TargetField::Validates, true, true, false),
    row(
      "produces", {K::TestResult}, {K::Test}, Direction::Up, TargetField::TestOf, true, true,
      false),
    row(
      "journey_addresses", {K::Journey}, {K::Requirement}, Direction::Down,
      TargetField::JourneyAddresses, false, false, false),
  };
  schema.add_level_rule({Level::Development, {Level::Operational, Level::Product}});
  schema.add_level_rule({Level::Operational, {Level::Product}});
  schema.add_level_rule({Level::Product, {Level::Product}});
  return schema;
}

}  // namespace reqtrace
