#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "reqtrace/graph/graph_json.hpp"
#include "reqtrace/test_support/build_helpers.hpp"

using namespace reqtrace;
using namespace reqtrace::test_support;
using nlohmann::json;

namespace
{

const json * find_node(const json & doc, const std::string & id)
{
  for (const auto & n : doc.at("nodes")) {
    if (n.at("id") == id) {
      return &n;
    }
  }
  return nullptr;
}

TestBuild sample_build()
{
  RequirementText prd{"REQ-p00001", "User login", "PRD"};
  prd.assertions = {"The system SHALL authenticate users."};
  RequirementText dup{"REQ-p00001", "Copy", "PRD"};

  BuildInput extra;
  extra.test_refs.push_back(make_test("test_login", {"REQ-p00001-A"}));
  extra.test_results.push_back(
    make_result("test:tests/test_main.cpp::test_login", TestStatus::Passed));

  return build_from_documents(
    {{"spec/prd.md", prd.str()}, {"spec/copy.md", dup.str()}}, std::move(extra));
}

}  // namespace

TEST(GraphJson, TopLevelShape)
{
  const auto b = sample_build();
  const json doc = graph_to_json(b.graph, b.schema);

  ASSERT_TRUE(doc.contains("nodes"));
  ASSERT_TRUE(doc.contains("edges"));
  ASSERT_TRUE(doc.contains("roots"));
  ASSERT_TRUE(doc.contains("conflicts"));
  ASSERT_TRUE(doc.contains("diagnostics"));

  // The conflicting copy is listed separately
  EXPECT_EQ(doc.at("nodes").size(), 4U);
  ASSERT_EQ(doc.at("conflicts").size(), 1U);
  EXPECT_EQ(doc.at("conflicts")[0].at("id"), "REQ-p00001");
  EXPECT_EQ(doc.at("conflicts")[0].at("source").at("path"), "spec/copy.md");

  ASSERT_EQ(doc.at("roots").size(), 1U);
  EXPECT_EQ(doc.at("roots")[0], "REQ-p00001");
}

TEST(GraphJson, NodeFields)
{
  const auto b = sample_build();
  const json doc = graph_to_json(b.graph, b.schema);

  const json * req = find_node(doc, "REQ-p00001");
  ASSERT_NE(req, nullptr);
  EXPECT_EQ(req->at("kind"), "requirement");
  EXPECT_EQ(req->at("label"), "User login");
  EXPECT_EQ(req->at("source").at("line"), 1);
  EXPECT_EQ(req->at("data").at("level"), "prd");
  EXPECT_EQ(req->at("data").at("status"), "Active");
  EXPECT_TRUE(req->at("data").at("stored_hash").is_null());
  EXPECT_EQ(req->at("children"), json::array({"REQ-p00001-A"}));
  EXPECT_EQ(req->at("metrics").at("total_assertions"), 1);
  EXPECT_DOUBLE_EQ(req->at("metrics").at("coverage_pct").get<double>(), 100.0);
  EXPECT_DOUBLE_EQ(req->at("metrics").at("pass_rate_pct").get<double>(), 100.0);

  const json * result = find_node(doc, "result:test:tests/test_main.cpp::test_login#1");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->at("kind"), "test_result");
  EXPECT_TRUE(result->at("source").is_null());
  EXPECT_EQ(result->at("data").at("status"), "passed");
}

TEST(GraphJson, EdgesNameTheirRelationship)
{
  const auto b = sample_build();
  const json doc = graph_to_json(b.graph, b.schema);

  ASSERT_EQ(doc.at("edges").size(), 3U);
  bool saw_validates = false;
  for (const auto & e : doc.at("edges")) {
    if (e.at("relationship") == "validates") {
      saw_validates = true;
      EXPECT_EQ(e.at("parent"), "REQ-p00001-A");
      EXPECT_EQ(e.at("child"), "test:tests/test_main.cpp::test_login");
    }
  }
  EXPECT_TRUE(saw_validates);
}

TEST(GraphJson, DiagnosticFields)
{
  const auto b = sample_build();
  const json doc = graph_to_json(b.graph, b.schema);

  ASSERT_EQ(doc.at("diagnostics").size(), 1U);
  const json & d = doc.at("diagnostics")[0];
  EXPECT_EQ(d.at("severity"), "error");
  EXPECT_EQ(d.at("check"), "duplicate-id");
  EXPECT_EQ(d.at("node"), "REQ-p00001");
  EXPECT_EQ(d.at("location").at("path"), "spec/copy.md");
}

TEST(GraphJson, UnlocatedDiagnostic)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.code = "orphan";
  d.message = "test x has no parent";

  const json out = diagnostic_to_json(d);
  EXPECT_EQ(out.at("severity"), "warning");
  EXPECT_TRUE(out.at("node").is_null());
  EXPECT_TRUE(out.at("location").is_null());
}

TEST(GraphJson, MetricsToJson)
{
  RollupMetrics m;
  m.total_assertions = 4;
  m.covered_assertions = 2;
  m.coverage_pct = 50.0;

  const json out = metrics_to_json(m);
  EXPECT_EQ(out.at("total_assertions"), 4);
  EXPECT_EQ(out.at("covered_assertions"), 2);
  EXPECT_DOUBLE_EQ(out.at("coverage_pct").get<double>(), 50.0);
  EXPECT_EQ(out.at("failed_tests"), 0);
}
