// reqtrace/graph/node_kind.cpp - Node kind names
#include "reqtrace/graph/node_kind.hpp"

#include "reqtrace/syntax/keywords.hpp"

namespace reqtrace
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::Requirement:
      return "requirement";
    case NodeKind::Assertion:
      return "assertion";
    case NodeKind::Code:
      return "code";
    case NodeKind::Test:
      return "test";
    case NodeKind::TestResult:
      return "test_result";
    case NodeKind::Journey:
      return "journey";
  }
  return "unknown";
}

std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept
{
  for (std::size_t i = 0; i < k_node_kind_count; ++i) {
    const auto kind = static_cast<NodeKind>(i);
    if (syntax::iequals(text, to_string(kind))) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace reqtrace
