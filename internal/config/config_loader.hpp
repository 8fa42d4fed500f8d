#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskgate::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset tunables are filled with their defaults afterwards.
*/
class ConfigLoader {
 public:
  static taskgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static taskgate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(taskgate::runtime::config::RuntimeConfig& config);
};

} // namespace taskgate::config
