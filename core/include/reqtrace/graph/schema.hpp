// reqtrace/graph/schema.hpp - Declarative relationship table driving the graph builder
//
// The builder knows nothing about specific relationships: it walks this
// table, reads each row's target field from the declaring node, and links
// the resolved targets in the row's direction. New relationship kinds are
// new rows, not new code.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "reqtrace/graph/node_kind.hpp"
#include "reqtrace/model/records.hpp"
#include "reqtrace/syntax/identifier.hpp"

namespace reqtrace
{

/**
 * Raised for a malformed schema. This is the only failure that aborts a build.
 */
class SchemaError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

// ============================================================================
// Relationship rows
// ============================================================================

enum class Direction : uint8_t {
  Up,    // declarer becomes the child of the target
  Down,  // declarer becomes the parent of the target
};

/**
 * Content field of the declaring node that lists target identifiers.
 */
enum class TargetField : uint8_t {
  Assertions,        // Requirement: its own assertions
  Implements,        // Requirement: Implements references
  Refines,           // Requirement: Refines references
  Addresses,         // Requirement: Addresses references
  Validates,         // Code / Test: targets
  TestOf,            // TestResult: owning test id
  JourneyAddresses,  // Journey: addressed requirement ids
};

[[nodiscard]] std::string_view to_string(TargetField field) noexcept;
[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

/// True if nodes of `kind` carry `field`
[[nodiscard]] bool field_available(TargetField field, NodeKind kind) noexcept;

struct RelationshipSpec
{
  std::string name;
  std::vector<NodeKind> source_kinds;
  std::vector<NodeKind> target_kinds;
  Direction direction = Direction::Up;
  TargetField field = TargetField::Implements;

  /// Edges contribute to coverage/pass-rate rollup and to cycle detection
  bool rolls_up = false;

  /// An edge of this kind gives its child a parent for the orphan check
  bool required_for_non_root = false;

  /// Edges are checked against the level hierarchy rules
  bool level_checked = false;

  [[nodiscard]] bool accepts_source(NodeKind kind) const noexcept;
  [[nodiscard]] bool accepts_target(NodeKind kind) const noexcept;

  /// Kinds that end up on the child side of an edge of this row
  [[nodiscard]] const std::vector<NodeKind> & child_kinds() const noexcept
  {
    return direction == Direction::Up ? source_kinds : target_kinds;
  }
};

// ============================================================================
// Policy sections
// ============================================================================

struct ValidationConfig
{
  bool orphan = true;
  bool cycle = true;
  bool broken_link = true;
  bool duplicate_id = true;
  bool assertion_coverage = true;
  bool level_constraint = true;
  bool hash = true;

  /// Report hash mismatches as errors instead of info
  bool strict_hash = false;

  /// Warn about requirements without a stored hash
  bool require_hash = false;
};

struct MetricsConfig
{
  /// Requirements with these statuses do not contribute to ancestors
  std::vector<Status> exclude_status = {Status::Deprecated, Status::Superseded, Status::Draft};

  bool count_placeholder_assertions = false;

  /// Count assertions covered only through an implementation of the whole requirement
  bool count_inferred_coverage = false;

  [[nodiscard]] bool excludes(Status status) const noexcept;
};

/**
 * "dev -> ops, prd": requirements of the left level may reference the listed levels.
 */
struct LevelRule
{
  Level child = Level::Development;
  std::vector<Level> parents;
};

/// @throws SchemaError on malformed text or unknown level names
[[nodiscard]] LevelRule parse_level_rule(std::string_view text);

// ============================================================================
// GraphSchema
// ============================================================================

struct GraphSchema
{
  std::vector<RelationshipSpec> relationships;
  std::map<Level, std::vector<Level>> level_rules;
  std::vector<Level> root_levels = {Level::Product};
  std::vector<NodeKind> root_kinds = {NodeKind::Journey};
  ValidationConfig validation;
  MetricsConfig metrics;

  /**
   * Check the table for contract violations.
   *
   * @throws SchemaError on empty or duplicate names, empty or unknown kinds,
   *         or a target field the source kind does not carry
   */
  void validate() const;

  /// @throws SchemaError if no row has this name
  [[nodiscard]] size_t relationship_index(std::string_view name) const;

  [[nodiscard]] const RelationshipSpec * find_relationship(std::string_view name) const noexcept;

  [[nodiscard]] const RelationshipSpec & relationship(size_t index) const
  {
    return relationships.at(index);
  }

  [[nodiscard]] bool level_allowed(Level child, Level parent) const;
  [[nodiscard]] bool is_root_kind(NodeKind kind) const noexcept;
  [[nodiscard]] bool is_root_level(Level level) const noexcept;

  /// True if some required row can give nodes of `kind` a parent
  [[nodiscard]] bool requires_parent(NodeKind kind) const noexcept;

  void add_level_rule(const LevelRule & rule);
};

/**
 * Built-in table: contains, implements, refines, addresses, validates,
 * produces, journey_addresses; hierarchy dev -> ops, prd / ops -> prd /
 * prd -> prd; product requirements and journeys are roots.
 */
[[nodiscard]] GraphSchema default_schema();

}  // namespace reqtrace
