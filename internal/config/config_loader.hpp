#pragma once

#include <string>

#include "config/config.pb.h"

namespace baton::config {

/*
  Loads the coordinator's RuntimeConfig (server, database, logging and the
  default workflow table) from YAML.

  YAML goes through google.protobuf.Value and JSON into the message, so the
  proto schema decides field names and enum spellings. Unknown fields and
  duplicate keys are errors. An empty document yields an all-default config;
  the workflow section is left as written and is normalized by the caller.
*/
class ConfigLoader {
 public:
  static baton::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same rules as LoadFromYaml; errors name the source as "<inline>".
  static baton::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace baton::config
