#pragma once

#include <string>

#include "config/config.pb.h"

namespace vesting::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Quoted scalars stay
  strings so addresses and 256-bit amounts survive the trip intact.
*/
class ConfigLoader {
 public:
  static vesting::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error naming the first offending field.
  static void Validate(const vesting::runtime::config::RuntimeConfig& config);
};

} // namespace vesting::config
