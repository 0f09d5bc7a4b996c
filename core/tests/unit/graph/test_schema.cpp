#include <gtest/gtest.h>

#include <string>

#include "reqtrace/graph/schema.hpp"

using namespace reqtrace;

TEST(GraphSchema, DefaultTableIsValid)
{
  const GraphSchema schema = default_schema();
  EXPECT_NO_THROW(schema.validate());
  EXPECT_EQ(schema.relationships.size(), 7U);

  const RelationshipSpec * implements = schema.find_relationship("implements");
  ASSERT_NE(implements, nullptr);
  EXPECT_EQ(implements->direction, Direction::Up);
  EXPECT_TRUE(implements->rolls_up);
  EXPECT_TRUE(implements->required_for_non_root);
  EXPECT_TRUE(implements->level_checked);
  EXPECT_TRUE(implements->accepts_target(NodeKind::Assertion));
  EXPECT_FALSE(implements->accepts_target(NodeKind::Test));

  const RelationshipSpec * refines = schema.find_relationship("refines");
  ASSERT_NE(refines, nullptr);
  EXPECT_FALSE(refines->rolls_up);
  EXPECT_FALSE(refines->required_for_non_root);

  EXPECT_EQ(schema.find_relationship("depends_on"), nullptr);
}

TEST(NodeKind, ParseIsCaseInsensitive)
{
  EXPECT_EQ(parse_node_kind("journey"), NodeKind::Journey);
  EXPECT_EQ(parse_node_kind("Test_Result"), NodeKind::TestResult);
  EXPECT_EQ(parse_node_kind("CODE"), NodeKind::Code);
  EXPECT_FALSE(parse_node_kind("widget").has_value());
  EXPECT_FALSE(parse_node_kind("").has_value());
  for (size_t i = 0; i < k_node_kind_count; ++i) {
    const auto kind = static_cast<NodeKind>(i);
    EXPECT_EQ(parse_node_kind(to_string(kind)), kind);
  }
}

TEST(GraphSchema, RelationshipIndex)
{
  const GraphSchema schema = default_schema();
  EXPECT_EQ(schema.relationship_index("contains"), 0U);
  EXPECT_EQ(schema.relationship(schema.relationship_index("validates")).name, "validates");
  EXPECT_THROW((void)schema.relationship_index("nope"), SchemaError);
}

TEST(GraphSchema, RequiresParent)
{
  const GraphSchema schema = default_schema();
  EXPECT_TRUE(schema.requires_parent(NodeKind::Requirement));
  EXPECT_TRUE(schema.requires_parent(NodeKind::Code));
  EXPECT_TRUE(schema.requires_parent(NodeKind::Test));
  EXPECT_TRUE(schema.requires_parent(NodeKind::TestResult));
  EXPECT_FALSE(schema.requires_parent(NodeKind::Assertion));
  EXPECT_FALSE(schema.requires_parent(NodeKind::Journey));
}

TEST(GraphSchema, RootKindsAndLevels)
{
  const GraphSchema schema = default_schema();
  EXPECT_TRUE(schema.is_root_kind(NodeKind::Journey));
  EXPECT_FALSE(schema.is_root_kind(NodeKind::Requirement));
  EXPECT_TRUE(schema.is_root_level(Level::Product));
  EXPECT_FALSE(schema.is_root_level(Level::Development));
}

TEST(GraphSchema, LevelRules)
{
  const GraphSchema schema = default_schema();
  EXPECT_TRUE(schema.level_allowed(Level::Development, Level::Operational));
  EXPECT_TRUE(schema.level_allowed(Level::Development, Level::Product));
  EXPECT_TRUE(schema.level_allowed(Level::Operational, Level::Product));
  EXPECT_TRUE(schema.level_allowed(Level::Product, Level::Product));
  EXPECT_FALSE(schema.level_allowed(Level::Product, Level::Development));
  EXPECT_FALSE(schema.level_allowed(Level::Operational, Level::Development));

  GraphSchema open;
  EXPECT_TRUE(open.level_allowed(Level::Product, Level::Development));
}

TEST(GraphSchema, ParseLevelRule)
{
  const LevelRule rule = parse_level_rule("dev -> ops, prd");
  EXPECT_EQ(rule.child, Level::Development);
  ASSERT_EQ(rule.parents.size(), 2U);
  EXPECT_EQ(rule.parents[0], Level::Operational);
  EXPECT_EQ(rule.parents[1], Level::Product);

  EXPECT_THROW((void)parse_level_rule("dev ops"), SchemaError);
  EXPECT_THROW((void)parse_level_rule("sys -> prd"), SchemaError);
  EXPECT_THROW((void)parse_level_rule("dev -> prd, sys"), SchemaError);
}

TEST(GraphSchema, AddLevelRuleMergesParents)
{
  GraphSchema schema;
  schema.add_level_rule({Level::Development, {Level::Product}});
  schema.add_level_rule({Level::Development, {Level::Product, Level::Operational}});
  ASSERT_EQ(schema.level_rules[Level::Development].size(), 2U);
}

TEST(GraphSchema, ValidateRejectsDuplicateName)
{
  GraphSchema schema = default_schema();
  schema.relationships.push_back(schema.relationships[1]);
  EXPECT_THROW(schema.validate(), SchemaError);
}

TEST(GraphSchema, ValidateRejectsEmptyKinds)
{
  GraphSchema schema = default_schema();
  RelationshipSpec rel;
  rel.name = "empty";
  rel.target_kinds = {NodeKind::Requirement};
  schema.relationships.push_back(rel);
  EXPECT_THROW(schema.validate(), SchemaError);
}

TEST(GraphSchema, ValidateRejectsFieldNotCarriedBySource)
{
  GraphSchema schema = default_schema();
  RelationshipSpec rel;
  rel.name = "tests_implement";
  rel.source_kinds = {NodeKind::Test};
  rel.target_kinds = {NodeKind::Requirement};
  rel.field = TargetField::Implements;
  schema.relationships.push_back(rel);
  EXPECT_THROW(schema.validate(), SchemaError);
}

TEST(GraphSchema, ValidateRejectsUnknownKind)
{
  GraphSchema schema = default_schema();
  schema.root_kinds.push_back(static_cast<NodeKind>(42));
  EXPECT_THROW(schema.validate(), SchemaError);
}

TEST(GraphSchema, MetricsConfigDefaults)
{
  const MetricsConfig cfg;
  EXPECT_TRUE(cfg.excludes(Status::Deprecated));
  EXPECT_TRUE(cfg.excludes(Status::Superseded));
  EXPECT_TRUE(cfg.excludes(Status::Draft));
  EXPECT_FALSE(cfg.excludes(Status::Active));
  EXPECT_FALSE(cfg.count_inferred_coverage);
}
