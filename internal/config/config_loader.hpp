#pragma once

#include <string>

#include "config/config.pb.h"

namespace usbforge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Absent fields get
  their defaults; out-of-range values throw util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static usbforge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same pipeline for an in-memory document.
  static usbforge::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(usbforge::runtime::config::RuntimeConfig& config);
  static void Validate(const usbforge::runtime::config::RuntimeConfig& config);
};

} // namespace usbforge::config
