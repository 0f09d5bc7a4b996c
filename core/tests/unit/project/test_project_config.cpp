#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "reqtrace/project/project_config.hpp"

using namespace reqtrace;
namespace fs = std::filesystem;

namespace
{

ProjectConfig parse_ok(const std::string & yaml)
{
  auto r = parse_project_config(yaml, "/work/project");
  EXPECT_TRUE(r.success) << r.error;
  return r.config;
}

std::string parse_error(const std::string & yaml)
{
  const auto r = parse_project_config(yaml, "/work/project");
  EXPECT_FALSE(r.success);
  return r.error;
}

class ScratchDir
{
public:
  explicit ScratchDir(const std::string & name)
  : path_(fs::temp_directory_path() / ("reqtrace_config_" + name))
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~ScratchDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  const fs::path & path() const { return path_; }

  void write(const fs::path & rel, const std::string & text) const
  {
    fs::create_directories((path_ / rel).parent_path());
    std::ofstream(path_ / rel) << text;
  }

private:
  fs::path path_;
};

}  // namespace

TEST(ProjectConfig, EmptyDocumentGivesDefaults)
{
  const auto cfg = parse_ok("");
  EXPECT_EQ(cfg.project_root, fs::path("/work/project"));
  EXPECT_EQ(cfg.identifiers.prefix, "REQ");
  EXPECT_EQ(cfg.identifiers.digits, 5U);
  EXPECT_TRUE(cfg.identifiers.allow_bare);
  ASSERT_EQ(cfg.documents.dirs.size(), 1U);
  EXPECT_EQ(cfg.documents.dirs[0], fs::path("spec"));
  EXPECT_EQ(cfg.documents.extensions, (std::vector<std::string>{".md"}));
  EXPECT_FALSE(cfg.records.has_value());
  EXPECT_EQ(cfg.logging.level, "warn");
  EXPECT_TRUE(cfg.build.parallel_parse);
  EXPECT_EQ(cfg.schema.relationships.size(), default_schema().relationships.size());
}

TEST(ProjectConfig, IdentifierSection)
{
  const auto cfg = parse_ok(R"(
project:
  name: billing
identifiers:
  prefix: SYS
  digits: 3
  allow_bare: false
  levels:
    product: P
    operational: O
    development: D
)");
  EXPECT_EQ(cfg.name, "billing");
  EXPECT_EQ(cfg.identifiers.prefix, "SYS");
  EXPECT_EQ(cfg.identifiers.digits, 3U);
  EXPECT_FALSE(cfg.identifiers.allow_bare);
  EXPECT_EQ(cfg.identifiers.product_code, 'P');
  EXPECT_EQ(cfg.identifiers.operational_code, 'O');
  EXPECT_EQ(cfg.identifiers.development_code, 'D');
}

TEST(ProjectConfig, DocumentsAndRecords)
{
  const auto cfg = parse_ok(R"(
documents:
  dirs: [spec, docs/requirements]
  extensions: [md, ".markdown"]
  exclude: [drafts]
records: build/trace.json
)");
  ASSERT_EQ(cfg.documents.dirs.size(), 2U);
  EXPECT_EQ(cfg.documents.dirs[1], fs::path("docs/requirements"));
  EXPECT_EQ(cfg.documents.extensions, (std::vector<std::string>{".md", ".markdown"}));
  EXPECT_EQ(cfg.documents.exclude, (std::vector<std::string>{"drafts"}));
  ASSERT_TRUE(cfg.records.has_value());
  EXPECT_EQ(*cfg.records, fs::path("/work/project") / "build/trace.json");
}

TEST(ProjectConfig, ValidationAndMetricsFlags)
{
  const auto cfg = parse_ok(R"(
validation:
  orphan: false
  strict_hash: true
  require_hash: true
metrics:
  exclude_status: [Deprecated]
  count_inferred_coverage: true
)");
  const auto & v = cfg.schema.validation;
  EXPECT_FALSE(v.orphan);
  EXPECT_TRUE(v.cycle);
  EXPECT_TRUE(v.strict_hash);
  EXPECT_TRUE(v.require_hash);

  const auto & m = cfg.schema.metrics;
  EXPECT_EQ(m.exclude_status, (std::vector<Status>{Status::Deprecated}));
  EXPECT_TRUE(m.count_inferred_coverage);
  EXPECT_FALSE(m.count_placeholder_assertions);
  EXPECT_FALSE(m.excludes(Status::Draft));
}

TEST(ProjectConfig, HierarchySection)
{
  const auto cfg = parse_ok(R"(
hierarchy:
  allowed:
    - "dev -> ops"
    - "ops -> prd"
  root_levels: [prd, ops]
)");
  const auto & rules = cfg.schema.level_rules;
  ASSERT_EQ(rules.count(Level::Development), 1U);
  EXPECT_EQ(rules.at(Level::Development), (std::vector<Level>{Level::Operational}));
  EXPECT_EQ(rules.count(Level::Product), 0U);
  EXPECT_EQ(cfg.schema.root_levels, (std::vector<Level>{Level::Product, Level::Operational}));
}

TEST(ProjectConfig, RelationshipOverrides)
{
  const auto cfg = parse_ok(R"(
relationships:
  refines:
    rolls_up: true
  addresses:
    required: false
)");
  const auto * refines = cfg.schema.find_relationship("refines");
  ASSERT_NE(refines, nullptr);
  EXPECT_TRUE(refines->rolls_up);
  const auto * addresses = cfg.schema.find_relationship("addresses");
  ASSERT_NE(addresses, nullptr);
  EXPECT_FALSE(addresses->required_for_non_root);
}

TEST(ProjectConfig, RelationshipKindOverrides)
{
  const auto cfg = parse_ok(R"(
relationships:
  validates:
    sources: [Test]
    targets: [requirement, ASSERTION]
)");
  const auto * validates = cfg.schema.find_relationship("validates");
  ASSERT_NE(validates, nullptr);
  EXPECT_EQ(validates->source_kinds, (std::vector<NodeKind>{NodeKind::Test}));
  EXPECT_EQ(
    validates->target_kinds, (std::vector<NodeKind>{NodeKind::Requirement, NodeKind::Assertion}));
  EXPECT_FALSE(validates->accepts_source(NodeKind::Code));

  EXPECT_EQ(
    parse_error("relationships:\n  validates:\n    targets: [widget]\n"),
    "relationships.validates.targets: unknown node kind 'widget'");
  EXPECT_NE(
    parse_error("relationships:\n  validates:\n    sources: [journey]\n").find("invalid schema"),
    std::string::npos);
}

TEST(ProjectConfig, LoggingAndBuild)
{
  const auto cfg = parse_ok(R"(
logging:
  level: debug
build:
  parallel_parse: false
)");
  EXPECT_EQ(cfg.logging.level, "debug");
  EXPECT_FALSE(cfg.build.parallel_parse);
}

TEST(ProjectConfig, Errors)
{
  EXPECT_NE(parse_error("identifiers: [unclosed").find("failed to parse YAML"), std::string::npos);
  EXPECT_EQ(parse_error("- a\n- b\n"), "configuration root must be a map");
  EXPECT_EQ(
    parse_error("identifiers:\n  digits: 12\n"), "identifiers.digits must be between 1 and 9");
  EXPECT_EQ(parse_error("identifiers:\n  digits: 0\n"), "identifiers.digits must be between 1 and 9");
  EXPECT_EQ(
    parse_error("identifiers:\n  levels:\n    product: pr\n"),
    "identifiers.levels.product must be a single character");
  EXPECT_EQ(parse_error("documents:\n  dirs: spec\n"), "documents.dirs must be a list");
  EXPECT_EQ(
    parse_error("metrics:\n  exclude_status: [Retired]\n"),
    "metrics.exclude_status: unknown status 'Retired'");
  EXPECT_EQ(
    parse_error("hierarchy:\n  root_levels: [top]\n"), "hierarchy.root_levels: unknown level 'top'");
  EXPECT_NE(
    parse_error("hierarchy:\n  allowed: [\"dev ops\"]\n").find("invalid schema"),
    std::string::npos);
  EXPECT_NE(
    parse_error("relationships:\n  depends_on:\n    rolls_up: true\n").find("invalid schema"),
    std::string::npos);
}

TEST(ProjectConfig, LoadAndFindFromDisk)
{
  ScratchDir dir("load");
  dir.write("reqtrace.yaml", "identifiers:\n  prefix: SYS\nrecords: trace.json\n");
  dir.write("spec/nested/readme.md", "# notes\n");

  const auto found = find_project_config(dir.path() / "spec" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), k_project_config_file_name);

  const auto r = load_project_config(*found);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.identifiers.prefix, "SYS");
  EXPECT_EQ(fs::weakly_canonical(r.config.project_root), fs::weakly_canonical(dir.path()));
  ASSERT_TRUE(r.config.records.has_value());
  EXPECT_EQ(r.config.records->filename(), "trace.json");
}

TEST(ProjectConfig, LoadMissingFile)
{
  const auto r = load_project_config("/nonexistent/reqtrace.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("configuration file not found"), std::string::npos);
}
