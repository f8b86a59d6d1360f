#pragma once

#include <string>

#include "config/config.pb.h"
#include "reconciler/v1/task.pb.h"

namespace reconciler::config {

/*
  Loads protobuf messages from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static reconciler::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static reconciler::v1::TaskManifest LoadTaskManifest(const std::string& path);
};

} // namespace reconciler::config
