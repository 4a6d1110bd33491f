#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sbomgraph::runtime::config {
class LoggingConfig;
}

namespace sbomgraph::observability {

/*
  Structured logging on top of spdlog.

  Every message is followed by its fields as key=value pairs; values
  containing spaces, quotes or '=' are quoted. The process logs through
  spdlog's default logger, so code running before InitializeLogging()
  (and the tests) still gets output.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// value rendered human readable, e.g. "12.5 MiB"
LogField BytesField(std::string_view key, std::uint64_t bytes);

// Environment (SBOMGRAPH_LOG_LEVEL, SBOMGRAPH_LOG_PATTERN,
// SBOMGRAPH_LOG_INCLUDE_TRACE_CONTEXT) overrides the config.
// Throws std::runtime_error on an unknown level name.
void InitializeLogging(const sbomgraph::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace sbomgraph::observability

#define SBOMGRAPH_LOG_DEBUG(message, ...) ::sbomgraph::observability::LogDebug((message), ##__VA_ARGS__)
#define SBOMGRAPH_LOG_INFO(message, ...) ::sbomgraph::observability::LogInfo((message), ##__VA_ARGS__)
#define SBOMGRAPH_LOG_WARN(message, ...) ::sbomgraph::observability::LogWarn((message), ##__VA_ARGS__)
#define SBOMGRAPH_LOG_ERROR(message, ...) ::sbomgraph::observability::LogError((message), ##__VA_ARGS__)
