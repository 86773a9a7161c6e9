#pragma once

#include <string>

#include "config/config.pb.h"

namespace settlement::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values are rejected by the protobuf JSON parser. Quoted YAML
  scalars always stay strings (hex keys made only of digits, for one).
*/
class ConfigLoader {
 public:
  static settlement::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static settlement::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Fills every unset section with its default.
  static void ApplyDefaults(settlement::runtime::config::RuntimeConfig& config);
};

} // namespace settlement::config
