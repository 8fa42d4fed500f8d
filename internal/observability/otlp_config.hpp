#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace taskgate::observability {

// Shared by tracing.cpp and metrics.cpp.
inline OtlpConfig ToOtlpConfig(const taskgate::runtime::config::RuntimeConfig& config, std::string_view service_name) {
  const auto& observability = config.observability();

  OtlpConfig out;
  out.service_name = std::string(service_name);
  out.endpoint     = observability.otlp_endpoint();
  out.transport    = observability.transport() == taskgate::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                 : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    out.export_interval_ms = observability.metrics_export_interval_ms();
  }
  return out;
}

// Explicit endpoint, then the signal-specific env var, then the generic one.
inline std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318" + std::string(http_path) : "localhost:4317";
}

} // namespace taskgate::observability
