// reqtrace/basic/logging.cpp - spdlog setup and field serialization
#include "reqtrace/basic/logging.hpp"

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>

namespace reqtrace
{

namespace
{

constexpr const char * k_logger_name = "reqtrace";

std::string resolve_level(const LoggingConfig & config)
{
  if (const char * level = std::getenv("REQTRACE_LOG_LEVEL")) {
    return level;
  }
  if (!config.level.empty()) {
    return config.level;
  }
  return "warn";
}

std::string resolve_pattern(const LoggingConfig & config)
{
  if (const char * pattern = std::getenv("REQTRACE_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.pattern.empty()) {
    return config.pattern;
  }
  return "[%H:%M:%S.%e] [%^%l%$] %v";
}

std::string serialize_fields(std::initializer_list<LogField> fields)
{
  std::ostringstream out;
  bool first = true;
  for (const auto & field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

}  // namespace

LogField string_field(std::string_view key, std::string_view value)
{
  return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value)
{
  return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value)
{
  return {std::string(key), value ? "true" : "false"};
}

LogField double_field(std::string_view key, double value)
{
  return {std::string(key), fmt::format("{:.2f}", value)};
}

void initialize_logging(const LoggingConfig & config)
{
  auto logger = spdlog::get(k_logger_name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(k_logger_name);
  }
  logger->set_pattern(resolve_pattern(config));
  logger->set_level(spdlog::level::from_str(resolve_level(config)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() { spdlog::shutdown(); }

void log(
  spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields)
{
  const auto serialized_fields = serialize_fields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

}  // namespace reqtrace
