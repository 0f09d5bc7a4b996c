// reqtrace/driver/trace_driver.cpp - Trace pipeline driver implementation
//
#include "reqtrace/driver/trace_driver.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iterator>
#include <sstream>
#include <utility>

#include "reqtrace/analysis/metrics.hpp"
#include "reqtrace/basic/logging.hpp"
#include "reqtrace/graph/graph_builder.hpp"
#include "reqtrace/project/record_loader.hpp"
#include "reqtrace/syntax/document_parser.hpp"

namespace reqtrace
{

namespace
{

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start)
{
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

bool excluded(const fs::path & path, const fs::path & root, const std::vector<std::string> & exclude)
{
  if (exclude.empty()) {
    return false;
  }
  for (const auto & part : path.lexically_relative(root)) {
    if (std::find(exclude.begin(), exclude.end(), part.string()) != exclude.end()) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct LoadedDocument
{
  fs::path path;
  std::string display_path;
  std::string content;
  fs::path root;
};

ParsedDocument parse_loaded(const LoadedDocument & doc, const IdentifierConfig & ids)
{
  DocumentParseOptions options;
  options.identifiers = ids;
  options.root = doc.root;
  return parse_document(doc.content, doc.display_path, options);
}

/// Parse every document; results come back in input order either way
std::vector<ParsedDocument> parse_all(
  const std::vector<LoadedDocument> & docs, const IdentifierConfig & ids, bool parallel)
{
  std::vector<ParsedDocument> out;
  out.reserve(docs.size());

  if (!parallel || docs.size() < 2) {
    for (const auto & doc : docs) {
      out.push_back(parse_loaded(doc, ids));
    }
    return out;
  }

  std::vector<std::future<ParsedDocument>> tasks;
  tasks.reserve(docs.size());
  for (const auto & doc : docs) {
    tasks.push_back(std::async(std::launch::async, [&doc, &ids]() {
      return parse_loaded(doc, ids);
    }));
  }
  for (auto & task : tasks) {
    out.push_back(task.get());
  }
  return out;
}

}  // namespace

std::vector<fs::path> TraceDriver::discover_documents(const ProjectConfig & config)
{
  std::vector<fs::path> found;
  const auto & docs = config.documents;

  for (const auto & dir : docs.dirs) {
    const fs::path root = config.project_root / dir;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      REQTRACE_LOG_WARN("document directory not found", {string_field("dir", root.string())});
      continue;
    }

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
      if (!it->is_regular_file(ec)) {
        continue;
      }
      const fs::path & p = it->path();
      const std::string ext = p.extension().string();
      if (std::find(docs.extensions.begin(), docs.extensions.end(), ext) == docs.extensions.end()) {
        continue;
      }
      if (excluded(p, root, docs.exclude)) {
        continue;
      }
      found.push_back(p);
    }
    if (ec) {
      REQTRACE_LOG_WARN(
        "document scan stopped early",
        {string_field("dir", root.string()), string_field("error", ec.message())});
    }
  }

  std::sort(found.begin(), found.end());
  found.erase(std::unique(found.begin(), found.end()), found.end());
  return found;
}

TraceResult TraceDriver::run(const ProjectConfig & config, const TraceOptions & options)
{
  TraceResult result;
  result.schema = config.schema;
  if (options.strict) {
    result.schema.validation.strict_hash = true;
  }

  // 1-2. Discover and read
  const auto paths = discover_documents(config);
  REQTRACE_LOG_INFO(
    "discovered documents", {int_field("count", static_cast<int64_t>(paths.size())),
                             string_field("root", config.project_root.string())});

  std::vector<LoadedDocument> docs;
  docs.reserve(paths.size());
  for (const auto & path : paths) {
    auto content = read_file(path);
    if (!content) {
      result.diagnostics.report_error("cannot read document: " + path.string())
        .with_code("io-error");
      continue;
    }

    LoadedDocument doc;
    doc.path = path;
    doc.display_path = path.lexically_relative(config.project_root).generic_string();
    if (doc.display_path.empty() || doc.display_path.rfind("..", 0) == 0) {
      doc.display_path = path.generic_string();
    }
    doc.content = std::move(*content);
    for (const auto & dir : config.documents.dirs) {
      const fs::path root = config.project_root / dir;
      const auto rel = path.lexically_relative(root);
      if (!rel.empty() && rel.begin()->string() != "..") {
        doc.root = root.lexically_relative(config.project_root);
        break;
      }
    }
    result.sources.register_file(doc.display_path, doc.content);
    docs.push_back(std::move(doc));
  }
  result.document_count = docs.size();

  // 3. Parse
  const bool parallel = options.parallel_parse.value_or(config.build.parallel_parse);
  auto start = Clock::now();
  auto parsed = parse_all(docs, config.identifiers, parallel);

  BuildInput input;
  for (auto & doc : parsed) {
    result.diagnostics.merge(std::move(doc.diagnostics));
    std::move(doc.requirements.begin(), doc.requirements.end(), std::back_inserter(input.requirements));
    std::move(doc.journeys.begin(), doc.journeys.end(), std::back_inserter(input.journeys));
  }
  REQTRACE_LOG_INFO(
    "parsed documents",
    {int_field("requirements", static_cast<int64_t>(input.requirements.size())),
     bool_field("parallel", parallel), double_field("ms", elapsed_ms(start))});

  // 4. External records
  const auto records_path = options.records ? options.records : config.records;
  if (records_path) {
    auto loaded = load_records(*records_path);
    if (!loaded.success) {
      REQTRACE_LOG_ERROR("record load failed", {string_field("error", loaded.error)});
      result.fatal_error = loaded.error;
      return result;
    }
    result.diagnostics.merge(std::move(loaded.diagnostics));
    const auto record_count = static_cast<int64_t>(loaded.records.size());
    auto & rec = loaded.records;
    input.code_refs = std::move(rec.code_refs);
    input.test_refs = std::move(rec.test_refs);
    input.test_results = std::move(rec.test_results);
    std::move(rec.journeys.begin(), rec.journeys.end(), std::back_inserter(input.journeys));
    REQTRACE_LOG_INFO(
      "loaded records", {string_field("path", records_path->string()),
                         int_field("count", record_count)});
  }

  // 5. Build
  start = Clock::now();
  BuildOptions build_options;
  build_options.identifiers = config.identifiers;
  try {
    auto built = build_graph(input, result.schema, build_options);
    result.graph.emplace(std::move(built.graph));
  } catch (const SchemaError & e) {
    REQTRACE_LOG_ERROR("invalid schema", {string_field("error", e.what())});
    result.fatal_error = std::string("invalid schema: ") + e.what();
    return result;
  }
  REQTRACE_LOG_INFO(
    "built graph", {int_field("nodes", static_cast<int64_t>(result.graph->node_count())),
                    int_field("edges", static_cast<int64_t>(result.graph->edge_count())),
                    double_field("ms", elapsed_ms(start))});

  // 6. Rollup
  start = Clock::now();
  compute_metrics(*result.graph, result.schema);
  REQTRACE_LOG_INFO("computed metrics", {double_field("ms", elapsed_ms(start))});

  result.diagnostics.merge(result.graph->diagnostics());

  REQTRACE_LOG_INFO(
    "trace finished",
    {int_field("errors", static_cast<int64_t>(result.diagnostics.count(Severity::Error))),
     int_field("warnings", static_cast<int64_t>(result.diagnostics.count(Severity::Warning))),
     int_field("info", static_cast<int64_t>(result.diagnostics.count(Severity::Info)))});

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace reqtrace
