#pragma once

#include <string>

#include "config/config.pb.h"

namespace codegraph::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON, parsed into protobuf, then validated.
  Every failure surfaces as util::InvalidConfiguration.
*/
class ConfigLoader {
 public:
  static codegraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static codegraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Rejects unknown upsert modes / attribute policies and an empty
  // sqlite path or postgres URI. Throws util::InvalidConfiguration.
  static void Validate(const codegraph::runtime::config::RuntimeConfig& config);
};

} // namespace codegraph::config
