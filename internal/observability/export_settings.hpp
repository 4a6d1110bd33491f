#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace sbomgraph::observability {

inline constexpr const char* kServiceName    = "sbom-graph";
inline constexpr const char* kServiceVersion = "0.1.0";

/*
  Where one OTLP signal ("traces" / "metrics") is exported to.

  Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default of the
  transport.
*/
struct ExportSettings {
  std::string   endpoint;
  bool          http = false;
  std::uint32_t interval_ms = 1000;
};

inline ExportSettings ResolveExportSettings(const sbomgraph::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  ExportSettings settings;
  settings.http = config.transport() == sbomgraph::runtime::config::OTLP_TRANSPORT_HTTP;
  if (config.metrics_interval_ms() > 0) settings.interval_ms = config.metrics_interval_ms();

  std::string signal_env = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) signal_env.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  signal_env += "_ENDPOINT";

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env.c_str())) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = settings.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  return settings;
}

} // namespace sbomgraph::observability
