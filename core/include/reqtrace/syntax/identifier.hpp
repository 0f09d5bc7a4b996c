// reqtrace/syntax/identifier.hpp - Requirement identifier grammar
//
// Canonical form:  [NS-]PREFIX-<level><sequence>[-L[-L...]]
//   e.g. REQ-p00001, CAL-REQ-d00042-A, REQ-o00003-A-C
// Bare form (no prefix) is accepted where a document already implies it:
//   e.g. p00001
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reqtrace
{

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  Product,
  Operational,
  Development,
};

/// Short level name: "prd", "ops" or "dev"
[[nodiscard]] std::string_view to_string(Level level) noexcept;

/**
 * Parse a level name as written in documents and config.
 *
 * Accepts short names (prd/ops/dev), long names (product, operational,
 * operations, development) and the single-letter codes, case-insensitively.
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;

// ============================================================================
// IdentifierConfig
// ============================================================================

struct IdentifierConfig
{
  std::string prefix = "REQ";
  uint32_t digits = 5;
  char product_code = 'p';
  char operational_code = 'o';
  char development_code = 'd';
  bool allow_bare = true;

  [[nodiscard]] char level_code(Level level) const noexcept;
  [[nodiscard]] std::optional<Level> level_from_code(char code) const noexcept;
};

// ============================================================================
// Identifier
// ============================================================================

enum class IdentifierForm : uint8_t {
  Qualified,  // REQ-p00001
  Bare,       // p00001
};

struct Identifier
{
  std::optional<std::string> ns;
  Level level = Level::Product;
  uint32_t sequence = 0;
  std::vector<char> assertion_labels;
  IdentifierForm form = IdentifierForm::Qualified;

  [[nodiscard]] bool is_assertion_scoped() const noexcept { return !assertion_labels.empty(); }

  /// Requirement-level identity (namespace + level + sequence), always qualified
  [[nodiscard]] std::string key(const IdentifierConfig & config = IdentifierConfig{}) const;

  /// Canonical qualified text including assertion labels
  [[nodiscard]] std::string to_string(const IdentifierConfig & config = IdentifierConfig{}) const;

  /// Same requirement without assertion labels
  [[nodiscard]] Identifier requirement() const;

  [[nodiscard]] Identifier with_label(char label) const;

  [[nodiscard]] bool operator==(const Identifier & other) const noexcept
  {
    return ns == other.ns && level == other.level && sequence == other.sequence &&
           assertion_labels == other.assertion_labels;
  }
  [[nodiscard]] bool operator!=(const Identifier & other) const noexcept
  {
    return !(*this == other);
  }
};

// ============================================================================
// Parsing
// ============================================================================

struct ParseFailure
{
  std::string message;

  /// Corrected text when the input matches a known mistake
  std::optional<std::string> suggestion;
};

struct IdentifierParseResult
{
  Identifier identifier;
  bool success = false;
  ParseFailure failure;

  static IdentifierParseResult ok(Identifier id)
  {
    IdentifierParseResult r;
    r.identifier = std::move(id);
    r.success = true;
    return r;
  }

  static IdentifierParseResult fail(std::string message, std::optional<std::string> suggestion = {})
  {
    IdentifierParseResult r;
    r.failure.message = std::move(message);
    r.failure.suggestion = std::move(suggestion);
    r.success = false;
    return r;
  }

  explicit operator bool() const noexcept { return success; }
};

/**
 * Parse identifier text.
 *
 * Never throws. A failure carries a message and, where the text matches a
 * known authoring mistake (wrong separator, wrong case, missing padding...),
 * the corrected identifier as a suggestion.
 */
[[nodiscard]] IdentifierParseResult parse_identifier(
  std::string_view text, const IdentifierConfig & config = IdentifierConfig{});

/**
 * Suggest a corrected spelling for text that is not a valid identifier.
 *
 * Returns the corrected text together with a short reason, or nullopt when
 * no correction yields a valid identifier.
 */
struct IdentifierCorrection
{
  std::string text;
  std::string reason;
};

[[nodiscard]] std::optional<IdentifierCorrection> suggest_identifier(
  std::string_view text, const IdentifierConfig & config = IdentifierConfig{});

/// True if `text` starts like an identifier (optional namespace, then prefix)
[[nodiscard]] bool looks_like_identifier(
  std::string_view text, const IdentifierConfig & config = IdentifierConfig{});

/// One single-label identifier per assertion label; the identifier itself if unlabeled
[[nodiscard]] std::vector<Identifier> expand_labels(const Identifier & id);

}  // namespace reqtrace
