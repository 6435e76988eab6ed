#pragma once

#include <string>

#include "config/config.pb.h"

namespace hosting::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields the file leaves
  unset are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static hosting::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults for a config built without a file (or a partial one).
  static hosting::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(hosting::runtime::config::RuntimeConfig* config);
};

} // namespace hosting::config
