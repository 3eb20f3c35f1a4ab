#pragma once

#include <string>

#include "config/config.pb.h"

namespace tender::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings, so identities such as
  "0x1234" or "42" are never turned into numbers.
*/
class ConfigLoader {
 public:
  static tender::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tender::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace tender::config
