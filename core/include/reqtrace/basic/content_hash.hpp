// reqtrace/basic/content_hash.hpp - Requirement content digests
//
// The short hash stored in a requirement's end marker is the first eight hex
// characters of SHA-256 over a normalized rendering of the requirement.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqtrace
{

/// Length of the hash written into end markers
inline constexpr std::size_t k_content_hash_length = 8;

/**
 * SHA-256 of `text` as 64 lowercase hex characters.
 *
 * @throws std::runtime_error if the OpenSSL digest fails
 */
[[nodiscard]] std::string sha256_hex(std::string_view text);

/**
 * Normalized text that the content hash is computed over.
 *
 * Lines: trimmed title, trimmed body lines without leading/trailing blank
 * lines, then one "L. text" line per assertion with whitespace collapsed.
 */
[[nodiscard]] std::string normalize_for_hash(
  std::string_view title, std::string_view body,
  const std::vector<std::pair<std::string, std::string>> & assertions);

/**
 * Short content hash of a requirement.
 *
 * @param assertions (label, text) pairs in document order
 */
[[nodiscard]] std::string content_hash(
  std::string_view title, std::string_view body,
  const std::vector<std::pair<std::string, std::string>> & assertions);

/// Collapse runs of whitespace into single spaces and trim both ends
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

}  // namespace reqtrace
