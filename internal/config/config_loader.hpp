#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace workbundle::config {

/*
  Loads protobuf messages from YAML.

  YAML is converted to JSON then parsed into protobuf, so every message
  accepts both snake_case and lowerCamelCase keys. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static workbundle::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);
  static void ParseMessageFromYaml(const std::string& yaml, google::protobuf::Message* message);
};

} // namespace workbundle::config
