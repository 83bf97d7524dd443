#pragma once

#include <string>

#include "config/config.pb.h"

namespace workledger::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so durations are
  written the protobuf JSON way ("30s", "900s"). Unset fields are filled
  from the built-in defaults; values that can never work are rejected.
*/
class ConfigLoader {
 public:
  static workledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static workledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(workledger::runtime::config::RuntimeConfig& config);
  static void Validate(const workledger::runtime::config::RuntimeConfig& config);
};

} // namespace workledger::config
