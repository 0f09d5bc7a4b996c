// reqtrace/basic/diagnostic.hpp - Diagnostic types for parsing and validation
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reqtrace/basic/source_manager.hpp"

namespace reqtrace
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related location
};

/**
 * A column span on one line of a document.
 *
 * Columns are 1-indexed. A zero column marks the whole line.
 */
struct Label
{
  SourceLocation location;
  uint32_t column = 0;
  uint32_t length = 0;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceLocation location;
  uint32_t column = 0;
  uint32_t length = 0;
  std::string replacement_text;
};

/**
 * One finding of the parser or of a graph check.
 *
 * `code` names the check that produced it (e.g. "broken-link").
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::optional<std::string> node_id;
  std::optional<SourceLocation> location;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and adds it to the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_node(std::string node_id);

  DiagnosticBuilder & at(SourceLocation location);

  /// Label a column span on the diagnostic's own line
  DiagnosticBuilder & with_label(
    uint32_t column, uint32_t length, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceLocation location, std::string msg);

  DiagnosticBuilder & with_fixit(uint32_t column, uint32_t length, std::string replacement);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(std::string message);
  DiagnosticBuilder report_error(SourceLocation location, std::string message);
  DiagnosticBuilder report_warning(std::string message);
  DiagnosticBuilder report_warning(SourceLocation location, std::string message);
  DiagnosticBuilder report_info(std::string message);
  DiagnosticBuilder report_info(SourceLocation location, std::string message);
  DiagnosticBuilder report_hint(SourceLocation location, std::string message);

  DiagnosticBuilder report(Severity severity, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;
  [[nodiscard]] size_t count(Severity severity) const;

  /// All diagnostics produced by one check
  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;
  [[nodiscard]] size_t count_code(std::string_view code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

/**
 * Graph-wide list of diagnostics returned by a build.
 */
using ValidationResult = DiagnosticBag;

}  // namespace reqtrace
