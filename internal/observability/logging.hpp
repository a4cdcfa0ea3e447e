#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace macrelay::runtime::config {
class RuntimeConfig;
}

namespace macrelay::observability {

/*
  Structured log line: a message followed by key=value pairs.
  Values containing blanks, quotes or '=' are quoted, so channel
  names and ffmpeg command lines stay on one parseable line.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Creates the "macrelay" logger once; later calls only reapply level and pattern.
void InitializeLogging(const macrelay::runtime::config::RuntimeConfig& config);

// Settings reload path: level and pattern follow the new file, env still wins.
void ApplyLoggingSettings(const macrelay::runtime::config::RuntimeConfig& config);

void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace macrelay::observability

#define MACRELAY_LOG_DEBUG(message, ...) ::macrelay::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define MACRELAY_LOG_INFO(message, ...) ::macrelay::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define MACRELAY_LOG_WARN(message, ...) ::macrelay::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define MACRELAY_LOG_ERROR(message, ...) ::macrelay::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
