#pragma once

#include <string>

#include "config/config.pb.h"

namespace dockyard::config {

/*
  Loads RuntimeConfig from YAML.

  The document goes YAML -> google.protobuf.Value -> JSON -> RuntimeConfig,
  so field names and types are checked by protobuf and unknown keys are
  rejected. After parsing:

  - relative host paths (sqlite path, scratch dir, base image rootfs, build
    contexts) are resolved against base_dir; LoadFromYaml uses the config
    file's directory
  - the result is validated (log level, subnets, base image references)

  Every failure is a std::runtime_error.
*/
class ConfigLoader {
 public:
  static dockyard::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static dockyard::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml, const std::string& base_dir = {});

  static void Validate(const dockyard::runtime::config::RuntimeConfig& config);
};

} // namespace dockyard::config
