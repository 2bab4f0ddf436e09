#pragma once

#include <string>

#include "config/config.pb.h"

namespace hashtax::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static hashtax::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace hashtax::config
