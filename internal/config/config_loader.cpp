#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/codec/task_codec.hpp"

namespace taskgate::config {

using taskgate::runtime::config::ChannelConfig;
using taskgate::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultPoolSize           = 1;
constexpr uint32_t kDefaultKeepAliveMs        = 30'000;
constexpr uint32_t kDefaultKeepAliveTimeoutMs = 10'000;
constexpr uint32_t kDefaultInitialWindowBytes = 1024 * 1024;
constexpr uint32_t kDefaultConnectTimeoutMs   = 5'000;
constexpr uint32_t kDefaultDeadlineMs         = 30'000;
constexpr uint32_t kDefaultFaultThreshold     = 3;
constexpr uint32_t kDefaultQueueCapacity      = 1024;
constexpr uint32_t kDefaultQueueWorkers       = 1;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

void ApplyChannelDefaults(ChannelConfig& channel) {
  if (channel.pool_size() == 0) channel.set_pool_size(kDefaultPoolSize);
  if (channel.keep_alive_interval_ms() == 0) channel.set_keep_alive_interval_ms(kDefaultKeepAliveMs);
  if (channel.keep_alive_timeout_ms() == 0) channel.set_keep_alive_timeout_ms(kDefaultKeepAliveTimeoutMs);
  if (!channel.has_keep_alive_while_idle()) channel.set_keep_alive_while_idle(true);
  if (channel.initial_window_bytes() == 0) channel.set_initial_window_bytes(kDefaultInitialWindowBytes);
  if (!channel.has_adaptive_window()) channel.set_adaptive_window(true);
  if (!channel.has_low_latency()) channel.set_low_latency(true);
  if (channel.connect_timeout_ms() == 0) channel.set_connect_timeout_ms(kDefaultConnectTimeoutMs);
  if (channel.default_deadline_ms() == 0) channel.set_default_deadline_ms(kDefaultDeadlineMs);
  if (channel.fault_threshold() == 0) channel.set_fault_threshold(kDefaultFaultThreshold);
  if (!channel.has_compress_list_responses()) channel.set_compress_list_responses(true);
}

} // namespace

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* wire = config.mutable_wire();
  if (wire->max_encoding_message_size() == 0) wire->set_max_encoding_message_size(codec::kDefaultMaxMessageSize);
  if (wire->max_decoding_message_size() == 0) wire->set_max_decoding_message_size(codec::kDefaultMaxMessageSize);

  ApplyChannelDefaults(*config.mutable_tasks_channel());
  ApplyChannelDefaults(*config.mutable_agent_channel());

  auto* queue = config.mutable_queue();
  if (queue->capacity() == 0) queue->set_capacity(kDefaultQueueCapacity);
  if (queue->workers() == 0) queue->set_workers(kDefaultQueueWorkers);
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(node);
}

} // namespace taskgate::config
