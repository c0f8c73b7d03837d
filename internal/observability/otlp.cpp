#include "internal/observability/telemetry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace tracereplay::observability {

namespace cfg = tracereplay::runtime::config;

OtlpConfig OtlpConfigFrom(const cfg::ReplayConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == cfg::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  // https:// endpoints imply TLS for gRPC.
  otlp.insecure = otlp.endpoint.rfind("https://", 0) != 0;
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string upper(signal);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const std::string signal_env = "OTEL_EXPORTER_OTLP_" + upper + "_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

#ifdef ENABLE_OTEL
opentelemetry::sdk::resource::Resource BuildOtlpResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.version", "0.1.0"},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}
#endif

} // namespace tracereplay::observability
