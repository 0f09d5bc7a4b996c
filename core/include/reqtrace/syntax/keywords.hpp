// reqtrace/syntax/keywords.hpp - Document keywords and known authoring mistakes
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace reqtrace::syntax
{

// Relationship keywords that may introduce a reference line
inline constexpr std::array<std::string_view, 3> k_reference_keywords = {
  "Implements",
  "Refines",
  "Addresses",
};

// Metadata keys recognized in a requirement preamble
inline constexpr std::array<std::string_view, 6> k_metadata_keys = {
  "Level", "Status", "Implements", "Refines", "Addresses", "Tags",
};

// Field keys recognized in a journey block
inline constexpr std::array<std::string_view, 4> k_journey_keys = {
  "Actor",
  "Goal",
  "Addresses",
  "Context",
};

// Misspellings seen in real documents, mapped to the intended keyword
inline constexpr std::array<std::pair<std::string_view, std::string_view>, 10>
  k_keyword_mistakes = {{
    {"implement", "Implements"},
    {"implemented", "Implements"},
    {"implementing", "Implements"},
    {"implments", "Implements"},
    {"satisfies", "Implements"},
    {"refine", "Refines"},
    {"refined", "Refines"},
    {"address", "Addresses"},
    {"adresses", "Addresses"},
    {"adress", "Addresses"},
  }};

// Values meaning "no references" on a reference line
inline constexpr std::array<std::string_view, 6> k_no_reference_values = {
  "-", "none", "null", "n/a", "x", "",
};

// Assertion texts that reserve a label without content
inline constexpr std::array<std::string_view, 6> k_placeholder_texts = {
  "reserved", "tbd", "placeholder", "removed", "deprecated", "n/a",
};

// Separators authors use in place of '-' inside identifiers
inline constexpr std::array<std::string_view, 6> k_separator_mistakes = {
  "_", ".", ":", " ", "\xE2\x80\x93", "\xE2\x80\x94",
};

inline constexpr std::string_view k_expected_broken_marker = "<!-- expected-broken -->";
inline constexpr std::string_view k_assertions_heading = "assertions";
inline constexpr std::string_view k_rationale_heading = "rationale";
inline constexpr std::string_view k_journey_prefix = "JNY";

/// Maximum distance accepted by the fallback keyword suggestion
inline constexpr std::size_t k_max_suggestion_distance = 2;

/// Levenshtein distance, compared case-insensitively
[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

/// Correction from the known-mistake table (case-insensitive lookup)
[[nodiscard]] std::optional<std::string_view> known_keyword_mistake(std::string_view word);

/**
 * Nearest reference keyword to `word`.
 *
 * Checks the known-mistake table first, then the keyword table by edit
 * distance. Exact and case-only matches are not suggestions.
 */
[[nodiscard]] std::optional<std::string_view> suggest_reference_keyword(std::string_view word);

/// Case-insensitive comparison
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

}  // namespace reqtrace::syntax
