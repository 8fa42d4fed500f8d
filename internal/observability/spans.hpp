#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace taskgate::runtime::config {
class RuntimeConfig;
}

namespace taskgate::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"taskgate"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

bool InitializeTracing(const taskgate::runtime::config::RuntimeConfig& config, std::string_view service_name = "taskgate");
bool InitializeMetrics(const taskgate::runtime::config::RuntimeConfig& config, std::string_view service_name = "taskgate");
void ShutdownTracing();
void ShutdownMetrics();

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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments:
    taskgate.request.count       counter   {pattern, success}
    taskgate.request.latency_ms  histogram {pattern}
    taskgate.job.duration_ms     histogram {operation}
    taskgate.pool.handles        gauge     {target}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view pattern, bool success);
  void ObserveRequestLatencyMs(std::string_view pattern, double latency_ms);
  void ObserveJobDurationMs(std::string_view operation, double duration_ms);
  void SetPoolHandles(std::string_view target, std::uint64_t live_handles);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const taskgate::runtime::config::RuntimeConfig&, std::string_view) {
  return false;
}

inline bool InitializeMetrics(const taskgate::runtime::config::RuntimeConfig&, std::string_view) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::SetPoolHandles(std::string_view, std::uint64_t) {
}
#endif

} // namespace taskgate::observability
