#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace claims::runtime::config {
class RuntimeConfig;
}

namespace claims::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string               service_name{"claim-coordinator"};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
};

OtlpConfig ResolveOtlpConfig(const claims::runtime::config::RuntimeConfig& config);

/*
  Endpoint precedence: config, then the signal specific environment
  variable (e.g. OTEL_EXPORTER_OTLP_TRACES_ENDPOINT), then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path);

} // namespace claims::observability
