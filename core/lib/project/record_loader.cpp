// reqtrace/project/record_loader.cpp - External verification records (JSON)

#include "reqtrace/project/record_loader.hpp"

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace reqtrace
{

using json = nlohmann::json;

namespace
{

std::vector<std::string> string_list(const json & j, const char * key)
{
  std::vector<std::string> out;
  if (!j.contains(key)) {
    return out;
  }
  for (const auto & item : j.at(key)) {
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::optional<std::string> optional_string(const json & j, const char * key)
{
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

uint32_t line_of(const json & j)
{
  if (!j.contains("line")) {
    return 0;
  }
  const auto line = j.at("line").get<int64_t>();
  if (line < 0) {
    throw std::invalid_argument("'line' must not be negative");
  }
  return static_cast<uint32_t>(line);
}

CodeReference parse_code(const json & j)
{
  CodeReference c;
  c.file = j.at("file").get<std::string>();
  c.line = line_of(j);
  c.symbol = optional_string(j, "symbol");
  c.targets = string_list(j, "targets");
  c.id = j.value("id", std::string{});
  return c;
}

TestReference parse_test(const json & j)
{
  TestReference t;
  t.file = j.at("file").get<std::string>();
  t.name = j.at("name").get<std::string>();
  t.line = line_of(j);
  t.suite = optional_string(j, "suite");
  t.targets = string_list(j, "targets");
  t.id = j.value("id", std::string{});
  return t;
}

TestResult parse_result(const json & j)
{
  TestResult r;
  r.test_id = j.at("test_id").get<std::string>();
  r.status = parse_test_status(j.value("status", std::string{}));
  r.duration_ms = j.value("duration_ms", 0.0);
  r.message = j.value("message", std::string{});
  r.id = j.value("id", std::string{});
  return r;
}

Journey parse_journey(const json & j, const std::string & source)
{
  Journey jn;
  jn.id = j.at("id").get<std::string>();
  jn.title = j.value("title", std::string{});
  jn.actor = j.value("actor", std::string{});
  jn.goal = j.value("goal", std::string{});
  jn.context = j.value("context", std::string{});
  jn.steps = string_list(j, "steps");
  jn.addresses = string_list(j, "addresses");
  jn.location.path = source;
  return jn;
}

/// Parse every entry of one section, skipping (and reporting) bad ones
template <typename T, typename Parse>
void parse_section(
  const json & root, const char * section, const std::string & source, std::vector<T> & out,
  DiagnosticBag & diags, Parse parse)
{
  if (!root.contains(section)) {
    return;
  }
  const json & entries = root.at(section);
  if (!entries.is_array()) {
    diags.report_warning(source + ": '" + section + "' must be an array")
      .with_code("bad-record");
    return;
  }

  for (size_t i = 0; i < entries.size(); ++i) {
    const std::string where = source + ": " + section + "[" + std::to_string(i) + "]";
    const json & entry = entries[i];
    if (!entry.is_object()) {
      diags.report_warning(where + ": entry must be an object").with_code("bad-record");
      continue;
    }
    try {
      out.push_back(parse(entry));
    } catch (const json::exception & e) {
      diags.report_warning(where + ": " + e.what()).with_code("bad-record");
    } catch (const std::invalid_argument & e) {
      diags.report_warning(where + ": " + e.what()).with_code("bad-record");
    }
  }
}

}  // namespace

RecordLoadResult parse_records(std::string_view json_text, const std::string & source_name)
{
  json root;
  try {
    root = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    return RecordLoadResult::fail(source_name + ": invalid JSON: " + e.what());
  }
  if (!root.is_object()) {
    return RecordLoadResult::fail(source_name + ": top level must be an object");
  }

  RecordSet set;
  DiagnosticBag diags;
  parse_section(root, "code", source_name, set.code_refs, diags, parse_code);
  parse_section(root, "tests", source_name, set.test_refs, diags, parse_test);
  parse_section(root, "results", source_name, set.test_results, diags, parse_result);
  parse_section(root, "journeys", source_name, set.journeys, diags, [&source_name](const json & j) {
    return parse_journey(j, source_name);
  });

  return RecordLoadResult::ok(std::move(set), std::move(diags));
}

RecordLoadResult load_records(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return RecordLoadResult::fail("cannot read record file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_records(ss.str(), path.string());
}

}  // namespace reqtrace
