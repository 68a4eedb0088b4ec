#pragma once

#include <string>

#include "config/config.pb.h"

namespace shipyard::config {

/*
  Reads the server's YAML configuration.

  The document is converted to JSON and parsed into RuntimeConfig, so
  field names follow config.proto and unknown keys are rejected.
  Every failure, from an unreadable file to a missing gateway token,
  raises util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static shipyard::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills gateway.token from the variable named by gateway.token_env.
  static void ResolveSecrets(shipyard::runtime::config::RuntimeConfig& config);

  static void ApplyDefaults(shipyard::runtime::config::RuntimeConfig& config);
  static void Validate(const shipyard::runtime::config::RuntimeConfig& config);
};

} // namespace shipyard::config
