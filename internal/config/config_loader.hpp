#pragma once

#include <string>

#include "config/config.pb.h"

namespace airspace::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static airspace::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static airspace::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace airspace::config
