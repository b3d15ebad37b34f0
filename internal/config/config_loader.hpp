#pragma once

#include <string>

#include "config/config.pb.h"

namespace upload::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields are filled from the built-in defaults and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static upload::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static upload::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(upload::runtime::config::RuntimeConfig& config);
  static void Validate(const upload::runtime::config::RuntimeConfig& config);
};

} // namespace upload::config
