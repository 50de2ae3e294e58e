#pragma once

#include <string>

#include "config/config.pb.h"

namespace fieldwake::config {

/*
  Loads RuntimeConfig from a YAML file or string.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected so typos in the config fail at startup.
*/
class ConfigLoader {
 public:
  static fieldwake::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fieldwake::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);
};

} // namespace fieldwake::config
