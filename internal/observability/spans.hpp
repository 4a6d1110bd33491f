#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sbomgraph::runtime::config {
class ObservabilityConfig;
}

namespace sbomgraph::observability {

// No-ops returning false unless built with ENABLE_OTEL and enabled in config.
bool InitializeTracing(const sbomgraph::runtime::config::ObservabilityConfig& config);
bool InitializeMetrics(const sbomgraph::runtime::config::ObservabilityConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the lifetime of the object; nested scopes become
  child spans.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  Gauges are sampled on collection through the registered callbacks; a
  callback returning nullopt reports nothing (its source is gone).
*/
class Metrics {
 public:
  using GaugeSource = std::function<std::optional<std::uint64_t>()>;

  static Metrics& Instance();

  // sbomgraph.request.count and sbomgraph.request.latency_ms
  void ObserveRequest(std::string_view route, bool success, double latency_ms);

  void ObserveGraphBuildMs(double duration_ms);

  // sbomgraph.analysis.cache_lookups, attribute "hit"
  void RecordCacheLookup(bool hit);
  void RecordCacheEviction();

  // sbomgraph.analysis.cache_size (bytes) and sbomgraph.analysis.cache_items
  void RegisterCacheGauges(GaugeSource size_used, GaugeSource items);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const sbomgraph::runtime::config::ObservabilityConfig&) {
  return false;
}

inline bool InitializeMetrics(const sbomgraph::runtime::config::ObservabilityConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::ObserveRequest(std::string_view, bool, double) {
}

inline void Metrics::ObserveGraphBuildMs(double) {
}

inline void Metrics::RecordCacheLookup(bool) {
}

inline void Metrics::RecordCacheEviction() {
}

inline void Metrics::RegisterCacheGauges(GaugeSource, GaugeSource) {
}
#endif

} // namespace sbomgraph::observability
