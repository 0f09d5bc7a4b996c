// reqtrace/graph/graph_json.cpp - JSON export implementation
//
#include "reqtrace/graph/graph_json.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace reqtrace
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_location(const SourceLocation & loc)
{
  if (!loc.is_valid()) {
    return nullptr;
  }
  json out{{"path", loc.path}, {"line", loc.line}};
  out["end_line"] = loc.end_line ? json(*loc.end_line) : json(nullptr);
  return out;
}

json j_keys(const TraceGraph & graph, const std::vector<NodeId> & ids)
{
  json out = json::array();
  for (const NodeId id : ids) {
    out.push_back(graph.node(id).key);
  }
  return out;
}

// ============================================================================
// Payload serialization
// ============================================================================

json j_requirement(const Requirement & req)
{
  json out{
    {"level", std::string(to_string(req.level))},
    {"status", std::string(to_string(req.status))},
    {"hash", req.computed_hash},
    {"tags", req.tags},
    {"subdirectory", req.subdirectory}};
  out["stored_hash"] = req.stored_hash ? json(*req.stored_hash) : json(nullptr);
  return out;
}

json j_data(const GraphNode & n)
{
  if (const auto * req = n.as<Requirement>()) {
    return j_requirement(*req);
  }
  if (const auto * a = n.as<Assertion>()) {
    return json{
      {"label", std::string(1, a->label)},
      {"placeholder", a->placeholder},
      {"expected_broken", a->expected_broken}};
  }
  if (const auto * code = n.as<CodeReference>()) {
    json out{{"file", code->file}, {"line", code->line}};
    out["symbol"] = code->symbol ? json(*code->symbol) : json(nullptr);
    return out;
  }
  if (const auto * test = n.as<TestReference>()) {
    json out{{"file", test->file}, {"line", test->line}, {"name", test->name}};
    out["suite"] = test->suite ? json(*test->suite) : json(nullptr);
    return out;
  }
  if (const auto * result = n.as<TestResult>()) {
    return json{
      {"test", result->test_id},
      {"status", std::string(to_string(result->status))},
      {"duration_ms", result->duration_ms},
      {"message", result->message}};
  }
  if (const auto * journey = n.as<Journey>()) {
    return json{
      {"actor", journey->actor},
      {"goal", journey->goal},
      {"context", journey->context},
      {"steps", journey->steps}};
  }
  return json::object();
}

json j_node(const TraceGraph & graph, const GraphNode & n)
{
  json out{
    {"id", n.key},
    {"kind", std::string(to_string(n.kind()))},
    {"label", n.label},
    {"source", j_location(n.location)},
    {"parents", j_keys(graph, graph.parents(n.id))},
    {"children", j_keys(graph, graph.children(n.id))},
    {"data", j_data(n)}};
  out["metrics"] = n.metrics ? metrics_to_json(*n.metrics) : json(nullptr);
  return out;
}

}  // namespace

json metrics_to_json(const RollupMetrics & m)
{
  return json{
    {"total_assertions", m.total_assertions},
    {"covered_assertions", m.covered_assertions},
    {"direct_covered", m.direct_covered},
    {"explicit_covered", m.explicit_covered},
    {"inferred_covered", m.inferred_covered},
    {"uncovered", m.uncovered},
    {"total_tests", m.total_tests},
    {"passed_tests", m.passed_tests},
    {"failed_tests", m.failed_tests},
    {"skipped_tests", m.skipped_tests},
    {"unknown_tests", m.unknown_tests},
    {"total_code_refs", m.total_code_refs},
    {"total_requirements", m.total_requirements},
    {"coverage_pct", m.coverage_pct},
    {"pass_rate_pct", m.pass_rate_pct}};
}

json diagnostic_to_json(const Diagnostic & diag)
{
  json out{
    {"severity", std::string(to_string(diag.severity))},
    {"check", diag.code},
    {"message", diag.message}};
  out["node"] = diag.node_id ? json(*diag.node_id) : json(nullptr);
  out["location"] = diag.location ? j_location(*diag.location) : json(nullptr);
  return out;
}

json graph_to_json(const TraceGraph & graph, const GraphSchema & schema)
{
  json nodes = json::array();
  json conflicts = json::array();
  for (const GraphNode & n : graph.nodes()) {
    if (n.conflict) {
      conflicts.push_back(json{{"id", n.key}, {"source", j_location(n.location)}});
      continue;
    }
    nodes.push_back(j_node(graph, n));
  }

  json edges = json::array();
  for (const Edge & e : graph.edges()) {
    edges.push_back(json{
      {"parent", graph.node(e.parent).key},
      {"child", graph.node(e.child).key},
      {"relationship", schema.relationship(e.relationship).name}});
  }

  json diagnostics = json::array();
  for (const Diagnostic & d : graph.diagnostics()) {
    diagnostics.push_back(diagnostic_to_json(d));
  }

  return json{
    {"nodes", std::move(nodes)},
    {"edges", std::move(edges)},
    {"roots", j_keys(graph, graph.roots())},
    {"conflicts", std::move(conflicts)},
    {"diagnostics", std::move(diagnostics)}};
}

}  // namespace reqtrace
