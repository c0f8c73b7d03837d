#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#ifdef ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/trace/tracer.h>
#endif

namespace tracereplay::runtime::config {
class ReplayConfig;
}

namespace tracereplay::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"trace-replay"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Exporter settings shared by the trace and metric pipelines.
OtlpConfig OtlpConfigFrom(const tracereplay::runtime::config::ReplayConfig& config);

/*
  Endpoint for one OTLP signal ("traces" or "metrics"), first match wins:
    1. the configured endpoint
    2. OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT
    3. OTEL_EXPORTER_OTLP_ENDPOINT
    4. the collector default for the transport
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

bool InitializeTracing(const tracereplay::runtime::config::ReplayConfig& config);
bool InitializeMetrics(const tracereplay::runtime::config::ReplayConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

#ifdef ENABLE_OTEL
opentelemetry::sdk::resource::Resource BuildOtlpResource(const OtlpConfig& config);

// Tracer replayed spans are created on. Null until InitializeTracing().
opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> ReplayTracer();
#endif

/*
  Counters describing the replay itself, not the replayed trace.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordDispatched(std::string_view kind);
  void RecordDropped(std::string_view reason);
  void ObservePacingLagMs(double lag_ms);
  void SetWorkerCount(std::uint64_t workers);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const tracereplay::runtime::config::ReplayConfig&) {
  return false;
}

inline bool InitializeMetrics(const tracereplay::runtime::config::ReplayConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordDispatched(std::string_view) {
}

inline void Metrics::RecordDropped(std::string_view) {
}

inline void Metrics::ObservePacingLagMs(double) {
}

inline void Metrics::SetWorkerCount(std::uint64_t) {
}
#endif

} // namespace tracereplay::observability
