#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TRACEREPLAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TRACEREPLAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"

namespace tracereplay::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
std::atomic<bool>                          g_metrics_enabled{false};

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(std::unique_ptr<sdkmetrics::PushMetricExporter> exporter,
                                                     const tracereplay::runtime::config::ObservabilityConfig::MetricsConfig& metrics) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 1000);
  if (metrics.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }

#ifdef TRACEREPLAY_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

// Older SDKs take the reader as a shared_ptr.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

using CounterPtr = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

// Adds one to a counter under a single string attribute.
void Increment(const CounterPtr& counter, opentelemetry::nostd::string_view key, std::string_view value) {
  const std::string                          text(value);
  const std::initializer_list<AttributePair> attributes = {{key, opentelemetry::nostd::string_view(text)}};
  counter->Add(static_cast<std::uint64_t>(1), attributes, opentelemetry::context::Context{});
}

template <typename Instrument, typename Value>
void RecordValue(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dispatched_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dropped_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      pacing_lag_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   worker_gauge;

  std::atomic<std::int64_t> workers{0};
};

bool InitializeMetrics(const tracereplay::runtime::config::ReplayConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);
  auto       reader      = MakeReader(MakeMetricExporter(otlp_config), config.observability().metrics());
  auto       resource    = BuildOtlpResource(otlp_config);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  AttachReader(*g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  g_metrics_enabled = true;
  return true;
}

void ShutdownMetrics() {
  g_metrics_enabled = false;
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("trace-replay", "0.1.0");

  impl_->dispatched_count = impl_->meter->CreateUInt64Counter("tracereplay.records.count", "Records dispatched to the backend", "1");
  impl_->dropped_count    = impl_->meter->CreateUInt64Counter("tracereplay.records.dropped", "Records skipped during replay", "1");
  impl_->pacing_lag_ms =
      impl_->meter->CreateDoubleHistogram("tracereplay.pacing.lag_ms", "Delay between a record's target time and its dispatch", "ms");
  impl_->worker_gauge = impl_->meter->CreateInt64ObservableGauge("tracereplay.workers.count", "Live replay worker threads", "1");
  impl_->worker_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->workers.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordDispatched(std::string_view kind) {
  if (g_metrics_enabled && impl_->dispatched_count) {
    Increment(impl_->dispatched_count, "kind", kind);
  }
}

void Metrics::RecordDropped(std::string_view reason) {
  if (g_metrics_enabled && impl_->dropped_count) {
    Increment(impl_->dropped_count, "reason", reason);
  }
}

void Metrics::ObservePacingLagMs(double lag_ms) {
  if (g_metrics_enabled && impl_->pacing_lag_ms) {
    RecordValue(impl_->pacing_lag_ms, lag_ms);
  }
}

void Metrics::SetWorkerCount(std::uint64_t workers) {
  impl_->workers = static_cast<std::int64_t>(workers);
}

} // namespace tracereplay::observability

#endif
