#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace taskgate::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";

bool g_include_trace_context{false};

// env var wins over config, config wins over the fallback
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const taskgate::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("TASKGATE_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

// Values holding spaces, quotes or '=' are quoted so lines stay machine-splittable.
void AppendValue(std::string& out, const std::string& value) {
  if (value.find_first_of(" \t\"=") == std::string::npos && !value.empty()) {
    out += value;
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

void AppendFields(std::string& out, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    out.push_back(' ');
    out += field.key;
    out.push_back('=');
    AppendValue(out, field.value);
  }
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  out += " trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const taskgate::runtime::config::RuntimeConfig& config, std::string_view logger_name) {
  spdlog::drop(std::string(logger_name));
  auto logger = spdlog::stdout_color_mt(std::string(logger_name));
  logger->set_pattern(Resolve("TASKGATE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Resolve("TASKGATE_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace taskgate::observability
