// reqtrace - Requirements traceability command line interface
//
// Usage:
//   reqtrace check [dir] [--config F] [--records F] [--strict] [--no-color]
//   reqtrace graph [dir] [-o out.json] [--config F] [--records F]
//   reqtrace hash <file>
//
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "reqtrace/basic/diagnostic_printer.hpp"
#include "reqtrace/basic/logging.hpp"
#include "reqtrace/driver/trace_driver.hpp"
#include "reqtrace/graph/graph_json.hpp"
#include "reqtrace/project/project_config.hpp"
#include "reqtrace/syntax/document_parser.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_errors = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "reqtrace v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [dir]              Validate documents and print coverage\n"
            << "  graph [dir]              Export the trace graph as JSON\n"
            << "  hash <file>              Print content hashes of a document\n\n"
            << "Options:\n"
            << "  -c, --config <path>      Project configuration (default: search reqtrace.yaml)\n"
            << "  -r, --records <path>     JSON record file (overrides configuration)\n"
            << "  -o, --output <path>      Output file for 'graph' (default: stdout)\n"
            << "  --strict                 Treat hash mismatches as errors\n"
            << "  --sequential             Parse documents on one thread\n"
            << "  --no-color               Disable colored output\n"
            << "  -v, --verbose            Log pipeline progress\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string config_path;
  std::string records_path;
  std::string output_path;
  bool strict = false;
  bool sequential = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  const auto take_value = [&](int & i, const std::string & flag, std::string & out) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      args.error = "missing value for " + flag;
    }
  };

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      take_value(i, arg, args.config_path);
    } else if (arg == "-r" || arg == "--records") {
      take_value(i, arg, args.records_path);
    } else if (arg == "-o" || arg == "--output") {
      take_value(i, arg, args.output_path);
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "--sequential") {
      args.sequential = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Project Setup
// ============================================================================

/// Config from --config, else reqtrace.yaml above the input directory, else defaults
std::optional<reqtrace::ProjectConfig> resolve_config(const CommandArgs & args)
{
  const fs::path dir = args.input.empty() ? fs::current_path() : fs::path(args.input);

  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    config_path = reqtrace::find_project_config(dir);
  }

  if (!config_path) {
    reqtrace::ProjectConfig config;
    config.project_root = fs::absolute(dir);
    config.documents.dirs = {"."};
    return config;
  }

  auto loaded = reqtrace::load_project_config(*config_path);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return std::nullopt;
  }
  return std::move(loaded.config);
}

void setup_logging(const reqtrace::ProjectConfig & config, const CommandArgs & args)
{
  reqtrace::LoggingConfig logging = config.logging;
  if (args.verbose) {
    logging.level = "info";
  }
  reqtrace::initialize_logging(logging);
}

std::optional<reqtrace::TraceResult> run_trace(const CommandArgs & args)
{
  auto config = resolve_config(args);
  if (!config) {
    return std::nullopt;
  }
  setup_logging(*config, args);

  reqtrace::TraceOptions options;
  options.strict = args.strict;
  if (args.sequential) {
    options.parallel_parse = false;
  }
  if (!args.records_path.empty()) {
    options.records = fs::absolute(args.records_path);
  }

  auto result = reqtrace::TraceDriver::run(*config, options);
  if (result.fatal_error) {
    std::cerr << "error: " << *result.fatal_error << "\n";
    return std::nullopt;
  }
  return result;
}

// ============================================================================
// Commands
// ============================================================================

void print_summary(const reqtrace::TraceResult & result)
{
  const auto & graph = *result.graph;
  std::cout << fmt::format(
    "{} documents, {} nodes, {} edges\n", result.document_count, graph.node_count(),
    graph.edge_count());

  for (const auto id : graph.roots()) {
    const auto & n = graph.node(id);
    if (n.kind() != reqtrace::NodeKind::Requirement || !n.metrics) {
      continue;
    }
    const auto & m = *n.metrics;
    std::cout << fmt::format(
      "  {:<16} {:>6.1f}% covered ({}/{})  tests {}/{} passed  {}\n", n.key, m.coverage_pct,
      m.covered_assertions, m.total_assertions, m.passed_tests, m.total_tests, n.label);
  }

  std::cout << fmt::format(
    "{} errors, {} warnings, {} info\n", result.diagnostics.count(reqtrace::Severity::Error),
    result.diagnostics.count(reqtrace::Severity::Warning),
    result.diagnostics.count(reqtrace::Severity::Info));
}

int cmd_check(const CommandArgs & args)
{
  auto result = run_trace(args);
  if (!result) {
    return k_exit_usage;
  }

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  reqtrace::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result->diagnostics, result->sources);

  print_summary(*result);
  return result->success ? k_exit_ok : k_exit_errors;
}

int cmd_graph(const CommandArgs & args)
{
  auto result = run_trace(args);
  if (!result) {
    return k_exit_usage;
  }

  const auto json = reqtrace::graph_to_json(*result->graph, result->schema);
  if (args.output_path.empty()) {
    std::cout << json.dump(2) << "\n";
  } else {
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return k_exit_usage;
    }
    out << json.dump(2) << "\n";
    std::cerr << "Wrote " << result->graph->node_count() << " nodes to " << args.output_path
              << "\n";
  }
  return result->success ? k_exit_ok : k_exit_errors;
}

int cmd_hash(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: no input file specified\n";
    return k_exit_usage;
  }

  std::ifstream file(args.input);
  if (!file.is_open()) {
    std::cerr << "error: cannot open file: " << args.input << "\n";
    return k_exit_usage;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  const auto doc = reqtrace::parse_document(buffer.str(), args.input);

  bool mismatch = false;
  for (const auto & req : doc.requirements) {
    std::string state = "no stored hash";
    if (req.stored_hash) {
      if (req.hash_matches()) {
        state = "ok";
      } else {
        state = "MISMATCH (stored " + *req.stored_hash + ")";
        mismatch = true;
      }
    }
    std::cout << fmt::format("{:<16} {}  {}\n", req.id.to_string(), req.computed_hash, state);
  }

  if (doc.diagnostics.has_errors()) {
    reqtrace::SourceRegistry sources;
    sources.register_file(args.input, buffer.str());
    const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
    reqtrace::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(doc.diagnostics, sources);
    return k_exit_errors;
  }
  return mismatch ? k_exit_errors : k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  try {
    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "graph") {
      return cmd_graph(args);
    }

    if (args.command == "hash") {
      return cmd_hash(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_usage;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}
