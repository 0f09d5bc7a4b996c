// reqtrace/syntax/document_parser.hpp - Line-oriented requirement document parser
//
// A requirement block looks like:
//
//   # REQ-d00001: Password hashing
//
//   **Level**: DEV | **Status**: Active | **Implements**: REQ-p00001-A
//
//   Body text...
//
//   ## Assertions
//
//   A. The system SHALL hash passwords with a per-user salt.
//
//   *End* *Password hashing* | **Hash**: 1a2b3c4d
//   ---
//
// Parsing never aborts: a malformed block is reported and skipped, and the
// parser resumes at the next header.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/model/records.hpp"
#include "reqtrace/syntax/identifier.hpp"

namespace reqtrace
{

struct DocumentParseOptions
{
  IdentifierConfig identifiers;

  /// Document root used to classify requirements by subdirectory
  std::filesystem::path root;
};

struct ParsedDocument
{
  std::string path;
  std::vector<Requirement> requirements;
  std::vector<Journey> journeys;
  DiagnosticBag diagnostics;
};

/**
 * Parse one document.
 *
 * @param text Full document text
 * @param path Path recorded in locations and diagnostics
 */
[[nodiscard]] ParsedDocument parse_document(
  std::string_view text, const std::string & path,
  const DocumentParseOptions & options = DocumentParseOptions{});

namespace syntax
{

class DocumentParser
{
public:
  DocumentParser(
    std::string_view text, std::string path, const DocumentParseOptions & options,
    DiagnosticBag & diags);

  void parse(std::vector<Requirement> & requirements, std::vector<Journey> & journeys);

private:
  struct Header
  {
    std::string_view id_text;
    std::string_view title;
  };

  enum class Section : uint8_t {
    Body,
    Rationale,
    Assertions,
    Other,
  };

  // Line helpers
  [[nodiscard]] bool at_eof() const noexcept { return idx_ >= lines_.size(); }
  [[nodiscard]] std::string_view cur() const noexcept { return lines_[idx_]; }
  [[nodiscard]] uint32_t line_no() const noexcept { return static_cast<uint32_t>(idx_ + 1); }
  [[nodiscard]] uint32_t column_of(std::string_view part) const noexcept;
  [[nodiscard]] SourceLocation here() const;

  // Block recognition
  [[nodiscard]] std::optional<Header> match_header(std::string_view line) const;
  [[nodiscard]] static bool is_end_marker(std::string_view line);
  [[nodiscard]] static std::optional<std::string_view> heading_text(std::string_view line);
  void skip_to_next_header();

  // Blocks
  void parse_requirement_block(const Header & header, std::vector<Requirement> & out);
  void parse_journey_block(const Header & header, std::vector<Journey> & out);

  // Requirement parts
  /// `preamble` is true until the first body prose line or `##` heading
  bool parse_metadata_line(
    std::string_view line, Requirement & req, bool & status_seen, bool preamble);
  void parse_reference_values(
    std::string_view relationship, std::string_view value, bool expected_broken,
    Requirement & req);
  void parse_assertion_line(std::string_view line, Requirement & req);
  [[nodiscard]] static std::optional<std::string> parse_end_hash(std::string_view line);
  void finish_requirement(Requirement & req, bool status_seen);

  std::string_view text_;
  std::string path_;
  const DocumentParseOptions & options_;
  DiagnosticBag & diags_;
  std::string subdirectory_;
  std::vector<std::string_view> lines_;
  size_t idx_ = 0;

  // Per-requirement assertion state
  bool continuation_open_ = false;
  bool reported_bullet_style_ = false;
};

}  // namespace syntax

}  // namespace reqtrace
