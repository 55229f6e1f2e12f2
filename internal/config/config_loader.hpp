#pragma once

#include <string>

#include "config/config.pb.h"

namespace failover::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; missing optional values are filled with node defaults.
*/
class ConfigLoader {
 public:
  static failover::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static failover::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Throws ConfigurationError when a required value is missing.
  static void ApplyDefaults(failover::runtime::config::RuntimeConfig* config);
};

} // namespace failover::config
