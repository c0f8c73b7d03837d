#pragma once

#include <string>

#include "config/config.pb.h"

namespace tracereplay::config {

/*
  Loads ReplayConfig from YAML.

  The YAML tree is turned into a google.protobuf.Value, printed as JSON and
  parsed into the config message, so YAML keys follow the proto field
  names and enums are written by name (DISPATCH_BACKEND_LOG, ...).

  A missing or empty document yields the default config. An unreadable
  file, unknown keys and ill-typed values throw util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static tracereplay::runtime::config::ReplayConfig LoadFromYaml(const std::string& path);
  static tracereplay::runtime::config::ReplayConfig LoadFromYamlString(const std::string& text);
};

} // namespace tracereplay::config
