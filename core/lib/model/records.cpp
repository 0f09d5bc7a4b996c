// reqtrace/model/records.cpp - Record helpers
#include "reqtrace/model/records.hpp"

#include "reqtrace/syntax/keywords.hpp"

namespace reqtrace
{

std::string_view to_string(Status status) noexcept
{
  switch (status) {
    case Status::Active:
      return "Active";
    case Status::Draft:
      return "Draft";
    case Status::Proposed:
      return "Proposed";
    case Status::Deprecated:
      return "Deprecated";
    case Status::Superseded:
      return "Superseded";
    case Status::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

std::optional<Status> parse_status(std::string_view text) noexcept
{
  using syntax::iequals;
  for (const Status s :
       {Status::Active, Status::Draft, Status::Proposed, Status::Deprecated,
        Status::Superseded}) {
    if (iequals(text, to_string(s))) {
      return s;
    }
  }
  return std::nullopt;
}

const Assertion * Requirement::find_assertion(char label) const noexcept
{
  for (const auto & a : assertions) {
    if (a.label == label) {
      return &a;
    }
  }
  return nullptr;
}

std::string CodeReference::node_id() const
{
  if (!id.empty()) {
    return id;
  }
  return "code:" + file + ":" + std::to_string(line);
}

std::string TestReference::node_id() const
{
  if (!id.empty()) {
    return id;
  }
  if (suite && !suite->empty()) {
    return "test:" + file + "::" + *suite + "::" + name;
  }
  return "test:" + file + "::" + name;
}

std::string_view to_string(TestStatus status) noexcept
{
  switch (status) {
    case TestStatus::Passed:
      return "passed";
    case TestStatus::Failed:
      return "failed";
    case TestStatus::Skipped:
      return "skipped";
    case TestStatus::Unknown:
      return "unknown";
  }
  return "unknown";
}

TestStatus parse_test_status(std::string_view text) noexcept
{
  using syntax::iequals;
  if (iequals(text, "passed") || iequals(text, "pass") || iequals(text, "ok")) {
    return TestStatus::Passed;
  }
  if (iequals(text, "failed") || iequals(text, "fail") || iequals(text, "error")) {
    return TestStatus::Failed;
  }
  if (iequals(text, "skipped") || iequals(text, "skip")) {
    return TestStatus::Skipped;
  }
  return TestStatus::Unknown;
}

}  // namespace reqtrace
