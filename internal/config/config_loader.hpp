#pragma once

#include <string>

#include "config/config.pb.h"

namespace cacheq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static cacheq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Rejects configurations the factory cannot build.
  static void Validate(const cacheq::runtime::config::RuntimeConfig& config);
};

} // namespace cacheq::config
