#pragma once

#include <string>

#include "config/config.pb.h"

namespace signage::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected the same way the JSON parser rejects them. A missing
  store section falls back to the local store under kDefaultStoreRoot.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultStoreRoot = "/tmp/signage-store";

  static signage::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given.
  static signage::runtime::config::RuntimeConfig Defaults();
};

} // namespace signage::config
