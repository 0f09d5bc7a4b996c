// reqtrace/basic/logging.hpp - Structured logging on top of spdlog
//
// Messages carry key=value fields. Only the driver and the CLI log; the
// parser and the graph code report through diagnostics.
//
#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace reqtrace
{

struct LogField
{
  std::string key;
  std::string value;
};

[[nodiscard]] LogField string_field(std::string_view key, std::string_view value);
[[nodiscard]] LogField int_field(std::string_view key, std::int64_t value);
[[nodiscard]] LogField bool_field(std::string_view key, bool value);
[[nodiscard]] LogField double_field(std::string_view key, double value);

/**
 * Logging section of reqtrace.yaml.
 *
 * REQTRACE_LOG_LEVEL and REQTRACE_LOG_PATTERN override the configured values.
 */
struct LoggingConfig
{
  std::string level = "warn";
  std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * Install the "reqtrace" logger (colored, stderr) as the default logger.
 *
 * Safe to call more than once; later calls reconfigure the existing logger.
 */
void initialize_logging(const LoggingConfig & config);
void shutdown_logging();

void log(
  spdlog::level::level_enum level, std::string_view message,
  std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {})
{
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {})
{
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {})
{
  log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {})
{
  log(spdlog::level::err, message, fields);
}

}  // namespace reqtrace

#define REQTRACE_LOG_DEBUG(message, ...) ::reqtrace::log_debug((message), ##__VA_ARGS__)
#define REQTRACE_LOG_INFO(message, ...) ::reqtrace::log_info((message), ##__VA_ARGS__)
#define REQTRACE_LOG_WARN(message, ...) ::reqtrace::log_warn((message), ##__VA_ARGS__)
#define REQTRACE_LOG_ERROR(message, ...) ::reqtrace::log_error((message), ##__VA_ARGS__)
