#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace tracereplay::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace cfg       = tracereplay::runtime::config;

namespace {

constexpr const char* kTracerName    = "trace-replay";
constexpr const char* kTracerVersion = "0.1.0";

// The provider is the replay destination, not self-instrumentation: it only
// exists when the OTLP dispatch backend is selected.
std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "traces");

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Batch unless the config asks for the simple processor.
std::unique_ptr<sdktrace::SpanProcessor> MakeSpanProcessor(std::unique_ptr<sdktrace::SpanExporter> exporter,
                                                           const cfg::ObservabilityConfig::TracingConfig& tracing) {
  if (tracing.processor() == cfg::ObservabilityConfig::TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  const auto&                         batch = tracing.batch();
  sdktrace::BatchSpanProcessorOptions options;
  if (batch.max_queue_size() > 0) {
    options.max_queue_size = batch.max_queue_size();
  }
  if (batch.max_export_batch_size() > 0) {
    options.max_export_batch_size = batch.max_export_batch_size();
  }
  if (batch.schedule_delay_ms() > 0) {
    options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

} // namespace

bool InitializeTracing(const cfg::ReplayConfig& config) {
  if (config.dispatch().backend() != cfg::DISPATCH_BACKEND_OTLP) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);
  auto processor = MakeSpanProcessor(MakeSpanExporter(otlp_config), config.observability().tracing());

  // Interest is decided by the dispatch; every span handed to the SDK is kept.
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), BuildOtlpResource(otlp_config));

  std::lock_guard lock(g_mutex);
  g_sdk_provider = std::move(provider);
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard lock(g_mutex);
  if (g_sdk_provider) {
    // Spans ended by the last workers may still be queued.
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> ReplayTracer() {
  std::lock_guard lock(g_mutex);
  return g_tracer;
}

} // namespace tracereplay::observability

#endif
