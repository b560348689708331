#pragma once

#include <string>

#include "config/config.pb.h"

namespace outflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, and Validate() checks the ranges the engine relies on.
*/
class ConfigLoader {
 public:
  static outflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static outflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  static void Validate(const outflow::runtime::config::RuntimeConfig& config);
};

} // namespace outflow::config
