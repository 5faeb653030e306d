#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace claims::runtime::config {
class RuntimeConfig;
}

namespace claims::observability {

// Both return false when the signal is disabled in config or ENABLE_OTEL is off.
bool InitializeTracing(const claims::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const claims::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  SpanScope

  One span per claim operation or background cycle, active for the
  lifetime of the object.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Metrics

  claims.operation.count        {op, outcome}   outcome is "ok", "error" or an error kind
  claims.operation.latency_ms   {op}
  claims.cycle.duration_ms      {cycle, interrupted}
  claims.transitions            {transition}    stolen, expired, requeued
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view op, std::string_view outcome);
  void ObserveOperationLatencyMs(std::string_view op, double latency_ms);
  void ObserveCycle(std::string_view cycle, double duration_ms, bool interrupted);
  void AddTransitions(std::string_view transition, std::uint64_t count = 1);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const claims::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const claims::runtime::config::RuntimeConfig&) {
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

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, std::string_view) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveCycle(std::string_view, double, bool) {
}

inline void Metrics::AddTransitions(std::string_view, std::uint64_t) {
}
#endif

} // namespace claims::observability
