// reqtrace/test_support/build_helpers.hpp - helpers for unit/integration tests
//
// Small builders for requirement document text and external records, plus a
// one-call pipeline (parse -> build -> rollup) over in-memory documents.
//
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "reqtrace/analysis/metrics.hpp"
#include "reqtrace/basic/diagnostic.hpp"
#include "reqtrace/graph/graph_builder.hpp"
#include "reqtrace/graph/schema.hpp"
#include "reqtrace/syntax/document_parser.hpp"

namespace reqtrace::test_support
{

/**
 * Text of one requirement block.
 */
struct RequirementText
{
  std::string id;
  std::string title;
  std::string level;
  std::string status = "Active";
  std::string implements;
  std::string body = "Body text.";
  std::vector<std::string> assertions;
  std::string hash;

  [[nodiscard]] std::string str() const
  {
    std::string out = "# " + id + ": " + title + "\n\n";
    out += "**Level**: " + level + " | **Status**: " + status;
    if (!implements.empty()) {
      out += " | **Implements**: " + implements;
    }
    out += "\n\n" + body + "\n\n";
    if (!assertions.empty()) {
      out += "## Assertions\n\n";
      char label = 'A';
      for (const auto & text : assertions) {
        out += std::string(1, label++) + ". " + text + "\n";
      }
      out += "\n";
    }
    out += "*End* *" + title + "*";
    if (!hash.empty()) {
      out += " | **Hash**: " + hash;
    }
    out += "\n---\n\n";
    return out;
  }
};

[[nodiscard]] inline TestReference make_test(
  std::string name, std::vector<std::string> targets, std::string file = "tests/test_main.cpp",
  uint32_t line = 10)
{
  TestReference t;
  t.file = std::move(file);
  t.line = line;
  t.name = std::move(name);
  t.targets = std::move(targets);
  return t;
}

[[nodiscard]] inline CodeReference make_code(
  std::string file, uint32_t line, std::vector<std::string> targets)
{
  CodeReference c;
  c.file = std::move(file);
  c.line = line;
  c.targets = std::move(targets);
  return c;
}

[[nodiscard]] inline TestResult make_result(std::string test_id, TestStatus status)
{
  TestResult r;
  r.test_id = std::move(test_id);
  r.status = status;
  return r;
}

struct TestDocument
{
  std::string path;
  std::string text;
};

struct TestBuild
{
  GraphSchema schema;
  DiagnosticBag parse_diags;
  TraceGraph graph;

  [[nodiscard]] const GraphNode & node(std::string_view key) const
  {
    const auto * n = graph.find_by_id(key);
    if (!n) {
      throw std::out_of_range("no node " + std::string(key));
    }
    return *n;
  }

  [[nodiscard]] const RollupMetrics & metrics(std::string_view key) const
  {
    return node(key).metrics.value();
  }
};

/**
 * Parse `docs` in order, add `extra` records, build with `schema`, and
 * compute metrics unless `rollup` is false.
 */
[[nodiscard]] inline TestBuild build_from_documents(
  const std::vector<TestDocument> & docs, BuildInput extra = {},
  GraphSchema schema = default_schema(), bool rollup = true)
{
  TestBuild out;
  out.schema = std::move(schema);

  for (const auto & doc : docs) {
    auto parsed = parse_document(doc.text, doc.path);
    out.parse_diags.merge(std::move(parsed.diagnostics));
    for (auto & r : parsed.requirements) {
      extra.requirements.push_back(std::move(r));
    }
    for (auto & j : parsed.journeys) {
      extra.journeys.push_back(std::move(j));
    }
  }

  out.graph = build_graph(extra, out.schema).graph;
  if (rollup) {
    compute_metrics(out.graph, out.schema);
  }
  return out;
}

}  // namespace reqtrace::test_support
