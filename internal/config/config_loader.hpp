#pragma once

#include <string>

#include "config/config.pb.h"

namespace flotilla::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset scheduler/controller fields receive the defaults below,
  and the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress     = "0.0.0.0:50061";
  static constexpr const char* kDefaultUrlScheme       = "https";
  static constexpr uint32_t    kDefaultStalenessSec    = 30;
  static constexpr uint32_t    kDefaultWatchdogMs      = 10000;
  static constexpr uint32_t    kDefaultNodeSweepMs     = 5000;
  static constexpr uint64_t    kDefaultEventRetention  = 100000;

  static flotilla::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flotilla::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(flotilla::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument naming the offending key.
  static void Validate(const flotilla::runtime::config::RuntimeConfig& config);
};

} // namespace flotilla::config
