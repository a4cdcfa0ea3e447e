#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace macrelay::observability {
namespace {

constexpr char kLoggerName[]     = "macrelay";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuotes(const std::string& value) {
  return value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuotes(value)) {
    out += value;
    return;
  }

  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const macrelay::runtime::config::RuntimeConfig& config) {
  if (!spdlog::get(kLoggerName)) {
    spdlog::set_default_logger(spdlog::stdout_color_mt(kLoggerName));
    spdlog::flush_on(spdlog::level::warn);
  }
  ApplyLoggingSettings(config);
}

void ApplyLoggingSettings(const macrelay::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::default_logger();
  logger->set_pattern(FromEnvOr("MACRELAY_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("MACRELAY_LOG_LEVEL", config.logging().level(), "info")));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  logger->log(level, "{}", line);
}

} // namespace macrelay::observability
