#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "reqtrace/project/record_loader.hpp"

using namespace reqtrace;

namespace
{

constexpr const char * k_records = R"({
  "code": [
    {"file": "src/auth.cpp", "line": 12, "symbol": "hash_password", "targets": ["REQ-d00001"]}
  ],
  "tests": [
    {"file": "tests/auth_test.cpp", "line": 40, "suite": "Auth", "name": "Hashes",
     "targets": ["REQ-d00001-A", "REQ-d00001-B"]}
  ],
  "results": [
    {"test_id": "test:tests/auth_test.cpp::Auth::Hashes", "status": "passed", "duration_ms": 1.5},
    {"test_id": "test:tests/auth_test.cpp::Auth::Hashes", "status": "FAIL", "message": "boom"},
    {"test_id": "test:tests/auth_test.cpp::Auth::Hashes", "status": "flaky"}
  ],
  "journeys": [
    {"id": "JNY-Login-01", "title": "Sign in", "actor": "User",
     "steps": ["Open app", "Enter password"], "addresses": ["REQ-p00001"]}
  ]
})";

}  // namespace

TEST(RecordLoader, ParsesAllSections)
{
  const auto r = parse_records(k_records, "trace.json");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.diagnostics.empty());
  EXPECT_EQ(r.records.size(), 6U);

  ASSERT_EQ(r.records.code_refs.size(), 1U);
  const auto & code = r.records.code_refs[0];
  EXPECT_EQ(code.file, "src/auth.cpp");
  EXPECT_EQ(code.line, 12U);
  ASSERT_TRUE(code.symbol.has_value());
  EXPECT_EQ(*code.symbol, "hash_password");
  EXPECT_EQ(code.targets, (std::vector<std::string>{"REQ-d00001"}));

  ASSERT_EQ(r.records.test_refs.size(), 1U);
  const auto & test = r.records.test_refs[0];
  EXPECT_EQ(test.name, "Hashes");
  ASSERT_TRUE(test.suite.has_value());
  EXPECT_EQ(*test.suite, "Auth");
  EXPECT_EQ(test.targets.size(), 2U);

  ASSERT_EQ(r.records.test_results.size(), 3U);
  EXPECT_EQ(r.records.test_results[0].status, TestStatus::Passed);
  EXPECT_DOUBLE_EQ(r.records.test_results[0].duration_ms, 1.5);
  EXPECT_EQ(r.records.test_results[1].status, TestStatus::Failed);
  EXPECT_EQ(r.records.test_results[1].message, "boom");
  EXPECT_EQ(r.records.test_results[2].status, TestStatus::Unknown);

  ASSERT_EQ(r.records.journeys.size(), 1U);
  const auto & jn = r.records.journeys[0];
  EXPECT_EQ(jn.id, "JNY-Login-01");
  EXPECT_EQ(jn.actor, "User");
  EXPECT_EQ(jn.steps.size(), 2U);
  EXPECT_EQ(jn.addresses, (std::vector<std::string>{"REQ-p00001"}));
  EXPECT_EQ(jn.location.path, "trace.json");
}

TEST(RecordLoader, MissingSectionsAreEmpty)
{
  const auto r = parse_records(R"({"tests": []})", "trace.json");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.records.size(), 0U);
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(RecordLoader, BadEntriesAreSkippedWithWarning)
{
  const auto r = parse_records(
    R"({
      "code": [{"line": 3}, {"file": "src/ok.cpp"}],
      "tests": [{"file": "t.cpp"}, 7],
      "results": [{"status": "passed"}],
      "journeys": "JNY-Login-01"
    })",
    "trace.json");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.records.code_refs.size(), 1U);
  EXPECT_EQ(r.records.code_refs[0].file, "src/ok.cpp");
  EXPECT_EQ(r.records.code_refs[0].line, 0U);
  EXPECT_TRUE(r.records.test_refs.empty());
  EXPECT_TRUE(r.records.test_results.empty());
  EXPECT_TRUE(r.records.journeys.empty());

  ASSERT_EQ(r.diagnostics.size(), 5U);
  for (const auto & d : r.diagnostics.all()) {
    EXPECT_EQ(d.severity, Severity::Warning);
    EXPECT_EQ(d.code, "bad-record");
  }
  EXPECT_EQ(r.diagnostics.all()[0].message.rfind("trace.json: code[0]: ", 0), 0U);
  EXPECT_EQ(r.diagnostics.all()[2].message, "trace.json: tests[1]: entry must be an object");
  EXPECT_EQ(r.diagnostics.all()[3].message.rfind("trace.json: results[0]: ", 0), 0U);
  EXPECT_EQ(r.diagnostics.all()[4].message, "trace.json: 'journeys' must be an array");
}

TEST(RecordLoader, JourneysSectionMustBeArray)
{
  const auto r = parse_records(R"({"journeys": {"id": "JNY-Login-01"}})", "trace.json");
  ASSERT_TRUE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_EQ(r.diagnostics.all()[0].message, "trace.json: 'journeys' must be an array");
}

TEST(RecordLoader, NegativeLineIsRejected)
{
  const auto r = parse_records(R"({"code": [{"file": "a.cpp", "line": -1}]})", "trace.json");
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.records.code_refs.empty());
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_EQ(r.diagnostics.all()[0].message, "trace.json: code[0]: 'line' must not be negative");
}

TEST(RecordLoader, InvalidDocumentFailsLoad)
{
  const auto broken = parse_records("{\"code\": [", "trace.json");
  EXPECT_FALSE(broken.success);
  EXPECT_EQ(broken.error.rfind("trace.json: invalid JSON: ", 0), 0U);

  const auto array = parse_records("[]", "trace.json");
  EXPECT_FALSE(array.success);
  EXPECT_EQ(array.error, "trace.json: top level must be an object");
}

TEST(RecordLoader, MissingFileFailsLoad)
{
  const auto r = load_records("/nonexistent/trace.json");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "cannot read record file: /nonexistent/trace.json");
}
