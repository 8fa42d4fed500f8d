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
#include <unordered_map>
#include <utility>

#include "internal/observability/otlp_config.hpp"

namespace taskgate::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveOtlpEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

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

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

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
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   pool_handles_gauge;

  std::mutex                                    pool_mutex;
  std::unordered_map<std::string, std::int64_t> pool_handles;
};

bool InitializeMetrics(const taskgate::runtime::config::RuntimeConfig& config, std::string_view service_name) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto otlp_config = ToOtlpConfig(config, service_name);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

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

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("taskgate", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("taskgate.request.count", "Dispatched requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("taskgate.request.latency_ms", "Dispatch latency", "ms");
  impl_->job_duration_ms    = impl_->meter->CreateDoubleHistogram("taskgate.job.duration_ms", "Queued job execution time", "ms");
  impl_->pool_handles_gauge = impl_->meter->CreateInt64ObservableGauge("taskgate.pool.handles", "Live pooled transport handles", "1");
  impl_->pool_handles_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->pool_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [target, handles] : impl->pool_handles) {
          const std::initializer_list<AttributePair> attributes = {{"target", target}};
          int_result->Observe(handles, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view pattern, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"pattern", std::string(pattern)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view pattern, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"pattern", std::string(pattern)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveJobDurationMs(std::string_view operation, double duration_ms) {
  if (!impl_ || !impl_->job_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}};
  RecordWithAttributes(impl_->job_duration_ms, duration_ms, attributes);
}

void Metrics::SetPoolHandles(std::string_view target, std::uint64_t live_handles) {
  if (!impl_ || !impl_->pool_handles_gauge) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->pool_mutex);
  impl_->pool_handles[std::string(target)] = static_cast<std::int64_t>(live_handles);
}

} // namespace taskgate::observability

#endif
