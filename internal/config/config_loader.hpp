#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace resource::config {

inline constexpr uint32_t kDefaultMaxFrameBytes    = 64u * 1024u * 1024u;
inline constexpr uint32_t kDefaultConnectTimeoutMs = 2000;
inline constexpr uint32_t kDefaultIoTimeoutMs      = 10000;
inline constexpr uint32_t kDefaultMaxRetries       = 2;
inline constexpr uint32_t kDefaultRetryBackoffMs   = 100;
inline constexpr uint32_t kDefaultQueueCapacity    = 256;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset tunables are filled with the defaults above.
*/
class ConfigLoader {
 public:
  static resource::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(resource::runtime::config::RuntimeConfig* config);
};

} // namespace resource::config
