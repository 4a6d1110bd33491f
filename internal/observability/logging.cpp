#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/byte_size.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace sbomgraph::observability {
namespace {

constexpr const char* kLoggerName     = "sbom-graph";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

std::string FromEnv(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to "off"
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("unknown log level: '" + name + "'");
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \"=\t\n") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\n') {
      out.append("\\n");
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out.append(" trace_id=");
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out.append(" span_id=");
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

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

LogField BytesField(std::string_view key, std::uint64_t bytes) {
  return {std::string(key), util::FormatByteSize(bytes)};
}

void InitializeLogging(const sbomgraph::runtime::config::LoggingConfig& config) {
  const auto level   = ParseLevel(FromEnv("SBOMGRAPH_LOG_LEVEL", config.level().empty() ? "info" : config.level()));
  const auto pattern = FromEnv("SBOMGRAPH_LOG_PATTERN", config.pattern().empty() ? kDefaultPattern : config.pattern());
  const auto trace   = FromEnv("SBOMGRAPH_LOG_INCLUDE_TRACE_CONTEXT", config.include_trace_context() ? "true" : "false");

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = trace == "1" || trace == "true";
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace sbomgraph::observability
