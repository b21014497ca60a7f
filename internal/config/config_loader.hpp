#pragma once

#include <string>

#include "config/config.pb.h"

namespace capsule::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; every failure surfaces as std::runtime_error naming its source.
*/
class ConfigLoader {
 public:
  static capsule::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static capsule::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace capsule::config
