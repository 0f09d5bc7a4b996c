// reqtrace/project/record_loader.hpp - External verification records (JSON)
//
// File shape:
//
//   {
//     "code":     [{"file": "src/auth.cpp", "line": 12, "symbol": "hash", "targets": ["REQ-d00001"]}],
//     "tests":    [{"file": "tests/auth_test.cpp", "line": 40, "suite": "Auth", "name": "Hashes",
//                   "targets": ["REQ-d00001-A"]}],
//     "results":  [{"test_id": "test:tests/auth_test.cpp::Auth::Hashes", "status": "passed",
//                   "duration_ms": 1.5}],
//     "journeys": [{"id": "JNY-Login-01", "title": "...", "addresses": ["REQ-p00001"]}]
//   }
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/model/records.hpp"

namespace reqtrace
{

struct RecordSet
{
  std::vector<CodeReference> code_refs;
  std::vector<TestReference> test_refs;
  std::vector<TestResult> test_results;
  std::vector<Journey> journeys;

  [[nodiscard]] size_t size() const noexcept
  {
    return code_refs.size() + test_refs.size() + test_results.size() + journeys.size();
  }
};

/**
 * Result of loading a record file.
 *
 * A malformed entry does not fail the load: it is skipped and reported as a
 * `bad-record` warning in `diagnostics`.
 */
struct RecordLoadResult
{
  RecordSet records;
  DiagnosticBag diagnostics;

  bool success = false;
  std::string error;

  static RecordLoadResult ok(RecordSet set, DiagnosticBag diags)
  {
    RecordLoadResult r;
    r.records = std::move(set);
    r.diagnostics = std::move(diags);
    r.success = true;
    return r;
  }

  static RecordLoadResult fail(std::string msg)
  {
    RecordLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

[[nodiscard]] RecordLoadResult load_records(const std::filesystem::path & path);

/**
 * Parse record JSON text.
 *
 * @param source_name Name used in diagnostics and default journey locations
 */
[[nodiscard]] RecordLoadResult parse_records(std::string_view json_text, const std::string & source_name);

}  // namespace reqtrace
