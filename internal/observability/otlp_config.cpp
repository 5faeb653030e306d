#include "internal/observability/otlp_config.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace claims::observability {

OtlpConfig ResolveOtlpConfig(const claims::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == claims::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) otlp.service_name = observability.service_name();
  if (observability.metrics_export_interval_ms() > 0) {
    otlp.export_interval = std::chrono::milliseconds(observability.metrics_export_interval_ms());
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318" + std::string(http_path);
  }
  return "localhost:4317";
}

} // namespace claims::observability
