#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, and the result is passed through ValidateConfig before it is
  returned.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relay::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace relay::config
