#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

#include "internal/observability/export_settings.hpp"

namespace sbomgraph::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      graph_build_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_evictions;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   cache_size_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   cache_items_gauge;

  std::mutex  gauge_mutex;
  GaugeSource cache_size;
  GaugeSource cache_items;
};

bool InitializeMetrics(const sbomgraph::runtime::config::ObservabilityConfig& config) {
  if (!config.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveExportSettings(config, "metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = settings.endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(settings.interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", kServiceName}, {"service.version", kServiceVersion}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

namespace {

void ObserveSource(metrics_api::ObserverResult result, Metrics::GaugeSource* source, std::mutex* mutex) {
  std::optional<std::uint64_t> value;
  {
    std::lock_guard<std::mutex> lock(*mutex);
    if (!*source) return;
    value = (*source)();
  }
  if (!value) return;

  auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
  int_result->Observe(static_cast<std::int64_t>(*value));
}

} // namespace

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(kServiceName, kServiceVersion);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("sbomgraph.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("sbomgraph.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->graph_build_ms     = impl_->meter->CreateDoubleHistogram("sbomgraph.analysis.graph_build_ms", "ms", "Time to load and build one SBOM graph");
  impl_->cache_lookups      = impl_->meter->CreateUInt64Counter("sbomgraph.analysis.cache_lookups", "1", "Graph cache lookups by outcome");
  impl_->cache_evictions    = impl_->meter->CreateUInt64Counter("sbomgraph.analysis.cache_evictions", "1", "Graphs evicted from the cache");

  impl_->cache_size_gauge = impl_->meter->CreateInt64ObservableGauge("sbomgraph.analysis.cache_size", "Weight of cached graphs", "By");
  impl_->cache_size_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl = static_cast<Impl*>(state);
        ObserveSource(result, &impl->cache_size, &impl->gauge_mutex);
      },
      impl_.get());

  impl_->cache_items_gauge = impl_->meter->CreateInt64ObservableGauge("sbomgraph.analysis.cache_items", "Number of cached graphs", "1");
  impl_->cache_items_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl = static_cast<Impl*>(state);
        ObserveSource(result, &impl->cache_items, &impl->gauge_mutex);
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::ObserveRequest(std::string_view route, bool success, double latency_ms) {
  const std::string route_name(route);

  const std::initializer_list<AttributePair> outcome = {{"route", route_name}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), outcome);

  const std::initializer_list<AttributePair> by_route = {{"route", route_name}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, by_route);
}

void Metrics::ObserveGraphBuildMs(double duration_ms) {
  RecordWithAttributes(impl_->graph_build_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordCacheLookup(bool hit) {
  const std::initializer_list<AttributePair> attributes = {{"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCacheEviction() {
  AddWithAttributes(impl_->cache_evictions, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RegisterCacheGauges(GaugeSource size_used, GaugeSource items) {
  std::lock_guard<std::mutex> lock(impl_->gauge_mutex);
  impl_->cache_size  = std::move(size_used);
  impl_->cache_items = std::move(items);
}

} // namespace sbomgraph::observability

#endif
