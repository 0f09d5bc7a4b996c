// reqtrace/model/records.hpp - Parsed requirements and external verification records
//
// These are the immutable inputs of a build. Requirements come from the
// document parser; code, test, result and journey records come from
// adapters outside this library (or from the JSON record loader).
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reqtrace/basic/source_manager.hpp"
#include "reqtrace/syntax/identifier.hpp"

namespace reqtrace
{

// ============================================================================
// Requirement content
// ============================================================================

enum class Status : uint8_t {
  Active,
  Draft,
  Proposed,
  Deprecated,
  Superseded,
  Unknown,
};

[[nodiscard]] std::string_view to_string(Status status) noexcept;

/// Case-insensitive; nullopt for anything not in the Status set
[[nodiscard]] std::optional<Status> parse_status(std::string_view text) noexcept;

/**
 * A single testable obligation inside a requirement.
 */
struct Assertion
{
  char label = 'A';
  std::string text;
  Identifier owner;
  uint32_t line = 0;

  /// Label reserved without normative text ("Reserved", "TBD", ...)
  bool placeholder = false;

  /// Coverage gaps for this assertion are expected and not reported
  bool expected_broken = false;

  /// Assertion-scoped identifier, e.g. REQ-p00001-A
  [[nodiscard]] Identifier identifier() const { return owner.with_label(label); }
};

/**
 * An outbound reference from a requirement (Implements/Refines/Addresses).
 */
struct Reference
{
  /// Relationship name in the graph schema ("implements", "refines", "addresses")
  std::string relationship;

  /// Target as written, after qualifying bare identifiers
  std::string target_text;

  /// Parsed target, when the text was a valid identifier
  std::optional<Identifier> target;

  uint32_t line = 0;
  bool expected_broken = false;
};

struct Requirement
{
  Identifier id;
  std::string title;
  Level level = Level::Product;
  Status status = Status::Unknown;
  std::string body;
  std::optional<std::string> rationale;
  std::vector<Assertion> assertions;
  std::vector<Reference> references;

  /// Hash written in the end marker, if any
  std::optional<std::string> stored_hash;

  /// Hash of the current title, body and assertions
  std::string computed_hash;

  SourceLocation location;
  std::vector<std::string> tags;

  /// Directory of the document relative to the document root ("" at top level)
  std::string subdirectory;

  /// Set when an earlier requirement already claimed this identifier
  bool conflict = false;

  [[nodiscard]] const Assertion * find_assertion(char label) const noexcept;
  [[nodiscard]] bool hash_matches() const noexcept
  {
    return stored_hash.has_value() && *stored_hash == computed_hash;
  }
};

// ============================================================================
// External records
// ============================================================================

struct CodeReference
{
  /// Stable id; defaults to "code:<file>:<line>"
  std::string id;
  std::string file;
  uint32_t line = 0;
  std::optional<std::string> symbol;
  std::vector<std::string> targets;

  [[nodiscard]] std::string node_id() const;
};

struct TestReference
{
  /// Stable id; defaults to "test:<file>::<suite>::<name>"
  std::string id;
  std::string file;
  uint32_t line = 0;
  std::string name;
  std::optional<std::string> suite;
  std::vector<std::string> targets;

  [[nodiscard]] std::string node_id() const;
};

enum class TestStatus : uint8_t {
  Passed,
  Failed,
  Skipped,
  Unknown,
};

[[nodiscard]] std::string_view to_string(TestStatus status) noexcept;

/// Accepts passed/pass/ok, failed/fail/error, skipped/skip; anything else is Unknown
[[nodiscard]] TestStatus parse_test_status(std::string_view text) noexcept;

struct TestResult
{
  /// Stable id; the builder assigns "result:<test_id>#<n>" when empty
  std::string id;
  std::string test_id;
  TestStatus status = TestStatus::Unknown;
  double duration_ms = 0.0;
  std::string message;
};

/**
 * A user journey. Non-normative: it addresses requirements but contributes
 * no coverage.
 */
struct Journey
{
  std::string id;
  std::string title;
  std::string actor;
  std::string goal;
  std::string context;
  std::vector<std::string> steps;
  std::vector<std::string> addresses;
  SourceLocation location;
};

}  // namespace reqtrace
