// reqtrace/syntax/keywords.cpp - Keyword lookup and suggestions
#include "reqtrace/syntax/keywords.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace reqtrace::syntax
{

namespace
{

char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

}  // namespace

bool iequals(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) {
      return false;
    }
  }
  return true;
}

std::size_t edit_distance(std::string_view a, std::string_view b)
{
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }
  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = lower(a[i - 1]) == lower(b[j - 1]) ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

std::optional<std::string_view> known_keyword_mistake(std::string_view word)
{
  for (const auto & [wrong, right] : k_keyword_mistakes) {
    if (iequals(word, wrong)) {
      return right;
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> suggest_reference_keyword(std::string_view word)
{
  for (const auto kw : k_reference_keywords) {
    if (iequals(word, kw)) {
      return std::nullopt;
    }
  }
  if (auto fixed = known_keyword_mistake(word)) {
    return fixed;
  }

  std::optional<std::string_view> best;
  std::size_t best_distance = k_max_suggestion_distance + 1;
  for (const auto kw : k_reference_keywords) {
    const std::size_t d = edit_distance(word, kw);
    if (d < best_distance) {
      best_distance = d;
      best = kw;
    }
  }
  return best;
}

}  // namespace reqtrace::syntax
