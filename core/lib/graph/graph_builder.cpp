// reqtrace/graph/graph_builder.cpp - Schema-driven graph construction

#include "reqtrace/graph/graph_builder.hpp"

#include <string>
#include <unordered_map>
#include <utility>

#include "reqtrace/analysis/coverage_checker.hpp"
#include "reqtrace/analysis/cycle_checker.hpp"
#include "reqtrace/analysis/hash_checker.hpp"
#include "reqtrace/analysis/level_checker.hpp"
#include "reqtrace/analysis/orphan_checker.hpp"

namespace reqtrace
{

namespace
{

/// One identifier listed in a node's target field
struct TargetRef
{
  std::string text;
  uint32_t line = 0;
  bool expected_broken = false;
};

std::string kind_list(const std::vector<NodeKind> & kinds)
{
  std::string out;
  for (size_t i = 0; i < kinds.size(); ++i) {
    if (i > 0) out += (i + 1 == kinds.size()) ? " or " : ", ";
    out += std::string(to_string(kinds[i]));
  }
  return out;
}

std::string relationship_of(TargetField field)
{
  switch (field) {
    case TargetField::Implements:
      return "implements";
    case TargetField::Refines:
      return "refines";
    case TargetField::Addresses:
      return "addresses";
    default:
      return {};
  }
}

class GraphBuilder
{
public:
  GraphBuilder(const GraphSchema & schema, const BuildOptions & options)
  : schema_(schema), ids_(options.identifiers)
  {
  }

  TraceGraph build(const BuildInput & input)
  {
    schema_.validate();

    add_requirements(input.requirements);
    add_externals(input);
    for (size_t row = 0; row < schema_.relationships.size(); ++row) {
      link_row(row);
    }
    compute_roots();
    run_checks();
    return std::move(graph_);
  }

private:
  // ===========================================================================
  // Nodes
  // ===========================================================================

  void report_duplicate(NodeId later, NodeId first)
  {
    const GraphNode & n = graph_.node(later);
    const GraphNode & f = graph_.node(first);
    graph_.mark_conflict(later);
    if (!schema_.validation.duplicate_id) {
      return;
    }

    auto builder = graph_.diagnostics().report_error("duplicate " +
                                                     std::string(to_string(n.kind())) +
                                                     " id " + n.key);
    builder.with_code("duplicate-id").with_node(n.key);
    if (n.location.is_valid()) {
      builder.at(n.location);
    }
    if (f.location.is_valid()) {
      builder.with_secondary_label(f.location, "first defined here")
        .with_help("first defined at " + f.location.to_string());
    }
  }

  NodeId add_indexed(std::string key, NodePayload payload, std::string label, SourceLocation loc)
  {
    const NodeId id = graph_.add_node(key, std::move(payload), std::move(label), std::move(loc));
    if (!graph_.index(key, id)) {
      report_duplicate(id, *graph_.lookup(key));
    }
    return id;
  }

  void add_requirements(const std::vector<Requirement> & reqs)
  {
    for (const auto & req : reqs) {
      const std::string key = req.id.key(ids_);
      const NodeId id = add_indexed(key, req, req.title, req.location);
      if (graph_.node(id).conflict) {
        continue;
      }

      for (const auto & a : req.assertions) {
        SourceLocation loc;
        loc.path = req.location.path;
        loc.line = a.line;
        add_indexed(a.identifier().to_string(ids_), a, a.text, std::move(loc));
      }
    }
  }

  void add_externals(const BuildInput & input)
  {
    for (const auto & code : input.code_refs) {
      SourceLocation loc;
      loc.path = code.file;
      loc.line = code.line;
      const std::string key = code.node_id();
      add_indexed(key, code, code.symbol.value_or(key), std::move(loc));
    }

    for (const auto & test : input.test_refs) {
      SourceLocation loc;
      loc.path = test.file;
      loc.line = test.line;
      add_indexed(test.node_id(), test, test.name, std::move(loc));
    }

    std::unordered_map<std::string, uint32_t> result_seq;
    for (const auto & result : input.test_results) {
      TestResult r = result;
      const uint32_t n = ++result_seq[r.test_id];
      if (r.id.empty()) {
        r.id = "result:" + r.test_id + "#" + std::to_string(n);
      }
      std::string key = r.id;
      std::string label = std::string(to_string(r.status));
      add_indexed(std::move(key), std::move(r), std::move(label), SourceLocation{});
    }

    for (const auto & journey : input.journeys) {
      add_indexed(journey.id, journey, journey.title, journey.location);
    }
  }

  // ===========================================================================
  // Edges
  // ===========================================================================

  std::vector<TargetRef> collect_targets(const GraphNode & n, TargetField field) const
  {
    std::vector<TargetRef> out;
    switch (field) {
      case TargetField::Assertions:
        if (const auto * req = n.as<Requirement>()) {
          for (const auto & a : req->assertions) {
            out.push_back(TargetRef{a.identifier().to_string(ids_), a.line, false});
          }
        }
        break;
      case TargetField::Implements:
      case TargetField::Refines:
      case TargetField::Addresses:
        if (const auto * req = n.as<Requirement>()) {
          const std::string rel = relationship_of(field);
          for (const auto & ref : req->references) {
            if (ref.relationship != rel) {
              continue;
            }
            std::string text = ref.target ? ref.target->to_string(ids_) : ref.target_text;
            out.push_back(TargetRef{std::move(text), ref.line, ref.expected_broken});
          }
        }
        break;
      case TargetField::Validates:
        if (const auto * code = n.as<CodeReference>()) {
          for (const auto & t : code->targets) {
            out.push_back(TargetRef{t, code->line, false});
          }
        } else if (const auto * test = n.as<TestReference>()) {
          for (const auto & t : test->targets) {
            out.push_back(TargetRef{t, test->line, false});
          }
        }
        break;
      case TargetField::TestOf:
        if (const auto * result = n.as<TestResult>()) {
          out.push_back(TargetRef{result->test_id, 0, false});
        }
        break;
      case TargetField::JourneyAddresses:
        if (const auto * journey = n.as<Journey>()) {
          for (const auto & t : journey->addresses) {
            out.push_back(TargetRef{t, journey->location.line, false});
          }
        }
        break;
    }
    return out;
  }

  SourceLocation location_for(const GraphNode & n, uint32_t line) const
  {
    SourceLocation loc = n.location;
    if (line > 0) {
      loc.line = line;
      loc.end_line.reset();
    }
    return loc;
  }

  void report_broken(
    const GraphNode & n, const RelationshipSpec & rel, const TargetRef & ref,
    const std::string & target, const std::string & reason)
  {
    if (!schema_.validation.broken_link) {
      return;
    }

    const SourceLocation loc = location_for(n, ref.line);
    std::string msg = n.key + " " + rel.name + " " + target + ": " + reason;
    if (loc.line > 0) {
      msg += " (line " + std::to_string(loc.line) + ")";
    }

    const Severity severity = ref.expected_broken ? Severity::Info : Severity::Error;
    auto builder = graph_.diagnostics().report(severity, std::move(msg));
    builder.with_code("broken-link").with_node(n.key);
    if (loc.is_valid()) {
      builder.at(loc);
    }
    if (ref.expected_broken) {
      builder.with_help("marked as expected broken");
    }
  }

  /**
   * Resolve one target text to node ids.
   *
   * Exact index lookup first; otherwise the text is parsed as an identifier
   * and every assertion label is looked up separately.
   */
  std::vector<NodeId> resolve(const GraphNode & n, const RelationshipSpec & rel, const TargetRef & ref)
  {
    if (const auto id = graph_.lookup(ref.text)) {
      return {*id};
    }

    const auto parsed = parse_identifier(ref.text, ids_);
    if (!parsed) {
      report_broken(n, rel, ref, ref.text, "unknown target");
      return {};
    }

    std::vector<NodeId> out;
    for (const auto & single : expand_labels(parsed.identifier)) {
      const std::string text = single.to_string(ids_);
      if (const auto id = graph_.lookup(text)) {
        out.push_back(*id);
        continue;
      }
      if (single.is_assertion_scoped() && graph_.lookup(single.key(ids_))) {
        report_broken(
          n, rel, ref, text,
          single.key(ids_) + " has no assertion " + std::string(1, single.assertion_labels.front()));
      } else {
        report_broken(n, rel, ref, text, "unknown target");
      }
    }
    return out;
  }

  void link_row(size_t row)
  {
    const RelationshipSpec & rel = schema_.relationship(row);
    const size_t count = graph_.node_count();

    for (uint32_t i = 0; i < count; ++i) {
      const NodeId declarer{i};
      const GraphNode & n = graph_.node(declarer);
      if (n.conflict || !rel.accepts_source(n.kind())) {
        continue;
      }

      for (const auto & ref : collect_targets(n, rel.field)) {
        for (const NodeId target : resolve(n, rel, ref)) {
          const GraphNode & t = graph_.node(target);
          if (!rel.accepts_target(t.kind())) {
            const SourceLocation loc = location_for(n, ref.line);
            auto builder = graph_.diagnostics().report_error(
              n.key + " " + rel.name + " " + t.key + ", which is a " +
              std::string(to_string(t.kind())) + "; expected " + kind_list(rel.target_kinds));
            builder.with_code("invalid-target").with_node(n.key);
            if (loc.is_valid()) {
              builder.at(loc);
            }
            continue;
          }

          if (rel.direction == Direction::Up) {
            graph_.link(target, declarer, row);
          } else {
            graph_.link(declarer, target, row);
          }
        }
      }
    }
  }

  // ===========================================================================
  // Roots and checks
  // ===========================================================================

  void compute_roots()
  {
    std::vector<NodeId> roots;
    for (const GraphNode & n : graph_.nodes()) {
      if (n.conflict) {
        continue;
      }
      bool has_parent = false;
      for (const size_t e : n.parent_edges) {
        const RelationshipSpec & rel = schema_.relationship(graph_.edge(e).relationship);
        if (rel.rolls_up || rel.required_for_non_root) {
          has_parent = true;
          break;
        }
      }
      if (!has_parent) {
        roots.push_back(n.id);
      }
    }
    graph_.set_roots(std::move(roots));
  }

  void run_checks()
  {
    const ValidationConfig & v = schema_.validation;
    DiagnosticBag * diags = &graph_.diagnostics();

    if (v.cycle) {
      CycleChecker(schema_, diags).check(graph_);
    }
    if (v.orphan) {
      OrphanChecker(schema_, diags).check(graph_);
    }
    if (v.level_constraint) {
      LevelChecker(schema_, diags).check(graph_);
    }
    if (v.assertion_coverage) {
      CoverageChecker(schema_, diags).check(graph_);
    }
    if (v.hash) {
      HashChecker(schema_, diags).check(graph_);
    }
  }

  const GraphSchema & schema_;
  const IdentifierConfig & ids_;
  TraceGraph graph_;
};

}  // namespace

BuildResult build_graph(
  const BuildInput & input, const GraphSchema & schema, const BuildOptions & options)
{
  GraphBuilder builder(schema, options);
  return BuildResult{builder.build(input)};
}

}  // namespace reqtrace
