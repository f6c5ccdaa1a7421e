#pragma once

#include <string>

#include "config/config.pb.h"

namespace ainp::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static ainp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static ainp::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace ainp::config
