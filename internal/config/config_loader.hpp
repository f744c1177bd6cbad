#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace prdchat::config {

inline constexpr std::int64_t  kDefaultCompressionThresholdChars = 50000;
inline constexpr std::int64_t  kDefaultTargetKeepChars           = 16000;
inline constexpr std::uint32_t kDefaultMinKeepCount              = 8;
inline constexpr std::uint32_t kDefaultCompressionMaxWaitMs      = 2000;
inline constexpr std::uint32_t kDefaultCompressionWorkers        = 2;
inline constexpr std::uint32_t kDefaultMaxCitations              = 12;
inline constexpr std::uint32_t kDefaultMaxHistoryMessages        = 20;
inline constexpr std::uint32_t kDefaultQueueCapacity             = 256;
inline constexpr std::uint32_t kDefaultCacheTtlSec               = 600;
inline constexpr std::uint32_t kDefaultLlmTimeoutMs              = 120000;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Zero-valued tunables are replaced by the defaults above.
*/
class ConfigLoader {
 public:
  static prdchat::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static prdchat::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(prdchat::runtime::config::RuntimeConfig& config);
};

} // namespace prdchat::config
