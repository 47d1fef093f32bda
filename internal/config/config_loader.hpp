#pragma once

#include <string>

#include "config/config.pb.h"

namespace lieko::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected the same way the JSON parser rejects them.
*/
class ConfigLoader {
 public:
  static lieko::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset fields with the defaults the server runs with.
  static void ApplyDefaults(lieko::runtime::config::RuntimeConfig& config);
};

} // namespace lieko::config
