// reqtrace/graph/node_kind.hpp - Kinds of graph nodes
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace reqtrace
{

/**
 * Node kinds. The order matches the alternatives of NodePayload.
 */
enum class NodeKind : uint8_t {
  Requirement,
  Assertion,
  Code,
  Test,
  TestResult,
  Journey,
};

inline constexpr std::size_t k_node_kind_count = 6;

[[nodiscard]] constexpr bool is_valid(NodeKind kind) noexcept
{
  return static_cast<std::size_t>(kind) < k_node_kind_count;
}

/// "requirement", "assertion", "code", "test", "test_result", "journey"
[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

[[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept;

}  // namespace reqtrace
