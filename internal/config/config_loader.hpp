#pragma once

#include <string>

#include "config/config.pb.h"

namespace sbomgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars stay strings, so "4096" can be given for a
  string field. Defaults are filled in for the server address and the
  database.
*/
class ConfigLoader {
 public:
  static sbomgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sbomgraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  static void ApplyDefaults(sbomgraph::runtime::config::RuntimeConfig& config);
};

} // namespace sbomgraph::config
