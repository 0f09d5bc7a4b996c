#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "reqtrace/driver/trace_driver.hpp"
#include "reqtrace/test_support/build_helpers.hpp"

using namespace reqtrace;
using namespace reqtrace::test_support;
namespace fs = std::filesystem;

namespace
{

class ScratchProject
{
public:
  explicit ScratchProject(const std::string & name)
  : root_(fs::temp_directory_path() / ("reqtrace_driver_" + name))
  {
    fs::remove_all(root_);
    fs::create_directories(root_);
    config_.project_root = root_;
  }
  ~ScratchProject()
  {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void write(const fs::path & rel, const std::string & text) const
  {
    fs::create_directories((root_ / rel).parent_path());
    std::ofstream(root_ / rel, std::ios::binary) << text;
  }

  const fs::path & root() const { return root_; }
  ProjectConfig & config() { return config_; }

private:
  fs::path root_;
  ProjectConfig config_;
};

std::vector<std::string> relative(const std::vector<fs::path> & paths, const fs::path & root)
{
  std::vector<std::string> out;
  for (const auto & p : paths) {
    out.push_back(p.lexically_relative(root).generic_string());
  }
  return out;
}

std::string product_doc()
{
  RequirementText prd{"REQ-p00001", "User login", "PRD"};
  prd.assertions = {"The system SHALL authenticate users."};
  return prd.str();
}

std::string dev_doc()
{
  RequirementText dev{"REQ-d00001", "Password hashing", "DEV"};
  dev.implements = "REQ-p00001";
  return dev.str();
}

}  // namespace

TEST(TraceDriver, DiscoverySortsAndFilters)
{
  ScratchProject p("discover");
  p.write("spec/zeta.md", "");
  p.write("spec/alpha.md", "");
  p.write("spec/auth/login.md", "");
  p.write("spec/notes.txt", "");
  p.write("spec/drafts/wip.md", "");
  p.write("docs/extra.markdown", "");
  p.config().documents.dirs = {"spec", "docs", "missing"};
  p.config().documents.extensions = {".md", ".markdown"};
  p.config().documents.exclude = {"drafts"};

  const auto found = TraceDriver::discover_documents(p.config());
  EXPECT_EQ(
    relative(found, p.root()), (std::vector<std::string>{
                                 "docs/extra.markdown", "spec/alpha.md", "spec/auth/login.md",
                                 "spec/zeta.md"}));
}

TEST(TraceDriver, RunsFullPipeline)
{
  ScratchProject p("run");
  p.write("spec/prd.md", product_doc());
  p.write("spec/auth/dev.md", dev_doc());
  p.write("trace.json", R"({
    "tests": [{"file": "tests/auth_test.cpp", "name": "Login", "targets": ["REQ-p00001-A"]}],
    "results": [{"test_id": "test:tests/auth_test.cpp::Login", "status": "passed"}]
  })");
  p.config().records = p.root() / "trace.json";

  const auto result = TraceDriver::run(p.config(), TraceOptions{});
  ASSERT_FALSE(result.fatal_error.has_value());
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.document_count, 2U);
  EXPECT_EQ(result.sources.size(), 2U);
  EXPECT_NE(result.sources.find_file("spec/auth/dev.md"), nullptr);
  EXPECT_TRUE(result.diagnostics.empty());

  ASSERT_TRUE(result.graph.has_value());
  const TraceGraph & g = *result.graph;
  EXPECT_TRUE(g.frozen());
  EXPECT_EQ(g.node_count(), 5U);

  const GraphNode * dev = g.find_by_id("REQ-d00001");
  ASSERT_NE(dev, nullptr);
  EXPECT_EQ(dev->location.path, "spec/auth/dev.md");
  EXPECT_EQ(dev->as<Requirement>()->subdirectory, "auth");

  const GraphNode * top = g.find_by_id("REQ-p00001");
  ASSERT_NE(top, nullptr);
  ASSERT_TRUE(top->metrics.has_value());
  EXPECT_EQ(top->metrics->total_requirements, 2U);
  EXPECT_DOUBLE_EQ(top->metrics->coverage_pct, 100.0);
  EXPECT_DOUBLE_EQ(top->metrics->pass_rate_pct, 100.0);
}

TEST(TraceDriver, SequentialAndParallelAgree)
{
  ScratchProject p("parallel");
  p.write("spec/prd.md", product_doc());
  p.write("spec/dev.md", dev_doc());

  TraceOptions sequential;
  sequential.parallel_parse = false;
  TraceOptions parallel;
  parallel.parallel_parse = true;

  const auto a = TraceDriver::run(p.config(), sequential);
  const auto b = TraceDriver::run(p.config(), parallel);
  ASSERT_TRUE(a.graph.has_value());
  ASSERT_TRUE(b.graph.has_value());
  ASSERT_EQ(a.graph->node_count(), b.graph->node_count());
  for (const GraphNode & n : a.graph->pre_order()) {
    const GraphNode * other = b.graph->find_by_id(n.key);
    ASSERT_NE(other, nullptr) << n.key;
    EXPECT_EQ(other->id, n.id);
  }
  EXPECT_EQ(a.diagnostics.size(), b.diagnostics.size());
}

TEST(TraceDriver, ErrorsFailTheRun)
{
  ScratchProject p("errors");
  p.write("spec/dev.md", dev_doc());

  const auto result = TraceDriver::run(p.config(), TraceOptions{});
  ASSERT_FALSE(result.fatal_error.has_value());
  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.graph.has_value());

  bool saw_broken = false;
  for (const auto & d : result.diagnostics.all()) {
    if (d.code == "broken-link") {
      saw_broken = true;
      EXPECT_EQ(d.severity, Severity::Error);
    }
  }
  EXPECT_TRUE(saw_broken);
}

TEST(TraceDriver, StrictMakesHashMismatchAnError)
{
  ScratchProject p("strict");
  RequirementText prd{"REQ-p00001", "Hashed", "PRD"};
  prd.hash = "deadbeef";
  p.write("spec/prd.md", prd.str());

  const auto lenient = TraceDriver::run(p.config(), TraceOptions{});
  EXPECT_TRUE(lenient.success);
  EXPECT_EQ(lenient.diagnostics.count(Severity::Info), 1U);

  TraceOptions strict;
  strict.strict = true;
  const auto failed = TraceDriver::run(p.config(), strict);
  EXPECT_FALSE(failed.success);
  EXPECT_TRUE(failed.schema.validation.strict_hash);
  EXPECT_EQ(failed.diagnostics.count(Severity::Error), 1U);
}

TEST(TraceDriver, UnreadableRecordsAreFatal)
{
  ScratchProject p("records");
  p.write("spec/prd.md", product_doc());

  TraceOptions options;
  options.records = p.root() / "missing.json";
  const auto result = TraceDriver::run(p.config(), options);
  ASSERT_TRUE(result.fatal_error.has_value());
  EXPECT_NE(result.fatal_error->find("missing.json"), std::string::npos);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.graph.has_value());
}

TEST(TraceDriver, BadRecordEntriesAreWarnings)
{
  ScratchProject p("bad_records");
  p.write("spec/prd.md", product_doc());
  p.write("trace.json", R"({"tests": [{"name": "no file"}]})");

  TraceOptions options;
  options.records = p.root() / "trace.json";
  const auto result = TraceDriver::run(p.config(), options);
  ASSERT_FALSE(result.fatal_error.has_value());
  ASSERT_FALSE(result.diagnostics.empty());
  EXPECT_EQ(result.diagnostics.all()[0].code, "bad-record");
  EXPECT_EQ(result.diagnostics.all()[0].severity, Severity::Warning);
}

TEST(TraceDriver, EmptyProject)
{
  ScratchProject p("empty");
  const auto result = TraceDriver::run(p.config(), TraceOptions{});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.document_count, 0U);
  ASSERT_TRUE(result.graph.has_value());
  EXPECT_EQ(result.graph->node_count(), 0U);
}
