#pragma once

#include <string>

#include "config/config.pb.h"

namespace codeintel::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Missing fields fall back to Defaults(); unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static codeintel::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in configuration used when no file is given.
  static codeintel::runtime::config::RuntimeConfig Defaults();

  // Environment overrides (CODEINTEL_AUDIT_LOG_DIR) applied after loading.
  static void ApplyEnvironment(codeintel::runtime::config::RuntimeConfig& config);
};

} // namespace codeintel::config
