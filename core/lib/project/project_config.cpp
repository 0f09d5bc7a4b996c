// reqtrace/project/project_config.cpp - Project configuration implementation
//
#include "reqtrace/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace reqtrace
{

namespace
{

/// Read a boolean key into `out` if present
void read_flag(const YAML::Node & section, const char * key, bool & out)
{
  if (section[key]) {
    out = section[key].as<bool>();
  }
}

std::vector<std::string> read_list(const YAML::Node & node, const std::string & what)
{
  if (!node.IsSequence()) {
    throw std::invalid_argument(what + " must be a list");
  }
  std::vector<std::string> out;
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

char read_level_code(const YAML::Node & node, const std::string & what)
{
  const auto text = node.as<std::string>();
  if (text.size() != 1) {
    throw std::invalid_argument(what + " must be a single character");
  }
  return text.front();
}

void parse_identifiers(const YAML::Node & node, IdentifierConfig & ids)
{
  if (node["prefix"]) {
    ids.prefix = node["prefix"].as<std::string>();
    if (ids.prefix.empty()) {
      throw std::invalid_argument("identifiers.prefix must not be empty");
    }
  }
  if (node["digits"]) {
    const int digits = node["digits"].as<int>();
    if (digits < 1 || digits > 9) {
      throw std::invalid_argument("identifiers.digits must be between 1 and 9");
    }
    ids.digits = static_cast<uint32_t>(digits);
  }
  read_flag(node, "allow_bare", ids.allow_bare);

  if (const auto levels = node["levels"]) {
    if (levels["product"]) {
      ids.product_code = read_level_code(levels["product"], "identifiers.levels.product");
    }
    if (levels["operational"]) {
      ids.operational_code =
        read_level_code(levels["operational"], "identifiers.levels.operational");
    }
    if (levels["development"]) {
      ids.development_code =
        read_level_code(levels["development"], "identifiers.levels.development");
    }
  }
}

void parse_hierarchy(const YAML::Node & node, GraphSchema & schema)
{
  if (node["allowed"]) {
    schema.level_rules.clear();
    for (const auto & rule : read_list(node["allowed"], "hierarchy.allowed")) {
      schema.add_level_rule(parse_level_rule(rule));
    }
  }
  if (node["root_levels"]) {
    schema.root_levels.clear();
    for (const auto & name : read_list(node["root_levels"], "hierarchy.root_levels")) {
      const auto level = parse_level(name);
      if (!level) {
        throw std::invalid_argument("hierarchy.root_levels: unknown level '" + name + "'");
      }
      schema.root_levels.push_back(*level);
    }
  }
}

void parse_validation(const YAML::Node & node, ValidationConfig & v)
{
  read_flag(node, "orphan", v.orphan);
  read_flag(node, "cycle", v.cycle);
  read_flag(node, "broken_link", v.broken_link);
  read_flag(node, "duplicate_id", v.duplicate_id);
  read_flag(node, "assertion_coverage", v.assertion_coverage);
  read_flag(node, "level_constraint", v.level_constraint);
  read_flag(node, "hash", v.hash);
  read_flag(node, "strict_hash", v.strict_hash);
  read_flag(node, "require_hash", v.require_hash);
}

void parse_metrics(const YAML::Node & node, MetricsConfig & m)
{
  if (node["exclude_status"]) {
    m.exclude_status.clear();
    for (const auto & name : read_list(node["exclude_status"], "metrics.exclude_status")) {
      const auto status = parse_status(name);
      if (!status) {
        throw std::invalid_argument("metrics.exclude_status: unknown status '" + name + "'");
      }
      m.exclude_status.push_back(*status);
    }
  }
  read_flag(node, "count_placeholder_assertions", m.count_placeholder_assertions);
  read_flag(node, "count_inferred_coverage", m.count_inferred_coverage);
}

std::vector<NodeKind> read_node_kinds(const YAML::Node & node, const std::string & what)
{
  std::vector<NodeKind> out;
  for (const auto & name : read_list(node, what)) {
    const auto kind = parse_node_kind(name);
    if (!kind) {
      throw std::invalid_argument(what + ": unknown node kind '" + name + "'");
    }
    out.push_back(*kind);
  }
  return out;
}

void parse_relationships(const YAML::Node & node, GraphSchema & schema)
{
  if (!node.IsMap()) {
    throw std::invalid_argument("relationships must be a map");
  }
  for (const auto & entry : node) {
    const auto name = entry.first.as<std::string>();
    auto & rel = schema.relationships.at(schema.relationship_index(name));
    read_flag(entry.second, "rolls_up", rel.rolls_up);
    read_flag(entry.second, "required", rel.required_for_non_root);
    if (entry.second["sources"]) {
      rel.source_kinds =
        read_node_kinds(entry.second["sources"], "relationships." + name + ".sources");
    }
    if (entry.second["targets"]) {
      rel.target_kinds =
        read_node_kinds(entry.second["targets"], "relationships." + name + ".targets");
    }
  }
}

ProjectConfig parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (const auto project = root["project"]) {
    if (project["name"]) {
      config.name = project["name"].as<std::string>();
    }
  }

  if (const auto ids = root["identifiers"]) {
    parse_identifiers(ids, config.identifiers);
  }

  if (const auto docs = root["documents"]) {
    if (docs["dirs"]) {
      config.documents.dirs.clear();
      for (const auto & d : read_list(docs["dirs"], "documents.dirs")) {
        config.documents.dirs.emplace_back(d);
      }
    }
    if (docs["extensions"]) {
      config.documents.extensions = read_list(docs["extensions"], "documents.extensions");
      for (auto & ext : config.documents.extensions) {
        if (!ext.empty() && ext.front() != '.') {
          ext.insert(ext.begin(), '.');
        }
      }
    }
    if (docs["exclude"]) {
      config.documents.exclude = read_list(docs["exclude"], "documents.exclude");
    }
  }

  if (root["records"]) {
    config.records = project_root / root["records"].as<std::string>();
  }

  if (const auto hierarchy = root["hierarchy"]) {
    parse_hierarchy(hierarchy, config.schema);
  }
  if (const auto validation = root["validation"]) {
    parse_validation(validation, config.schema.validation);
  }
  if (const auto metrics = root["metrics"]) {
    parse_metrics(metrics, config.schema.metrics);
  }
  if (const auto rels = root["relationships"]) {
    parse_relationships(rels, config.schema);
  }

  if (const auto logging = root["logging"]) {
    if (logging["level"]) {
      config.logging.level = logging["level"].as<std::string>();
    }
    if (logging["pattern"]) {
      config.logging.pattern = logging["pattern"].as<std::string>();
    }
  }

  if (const auto build = root["build"]) {
    read_flag(build, "parallel_parse", config.build.parallel_parse);
  }

  config.schema.validate();
  return config;
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    const YAML::Node root = YAML::Load(yaml_text);
    if (root.IsNull()) {
      ProjectConfig config;
      config.project_root = project_root;
      return ConfigLoadResult::ok(std::move(config));
    }
    if (!root.IsMap()) {
      return ConfigLoadResult::fail("configuration root must be a map");
    }
    return ConfigLoadResult::ok(parse_root(root, project_root));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  } catch (const SchemaError & e) {
    return ConfigLoadResult::fail("invalid schema: " + std::string(e.what()));
  } catch (const std::invalid_argument & e) {
    return ConfigLoadResult::fail(e.what());
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in) {
    return ConfigLoadResult::fail("cannot read configuration file: " + config_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  return parse_project_config(ss.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace reqtrace
