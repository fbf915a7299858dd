#pragma once

#include <string>

#include "config/config.pb.h"

namespace relgen::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected; failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static relgen::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static relgen::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace relgen::config
