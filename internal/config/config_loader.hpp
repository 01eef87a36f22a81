#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace buildq::config {

/*
  Loads RuntimeConfig from YAML.

  The document is converted to a protobuf Value, rendered as JSON and parsed
  with the proto3 JSON rules, so field names, enum names and Duration strings
  ("30s", "0.5s") follow the JSON mapping. Unknown fields are rejected.

  Only plain scalars are typed: `port: 50061` becomes a number, while
  `key_prefix: "1234"` stays a string.

  All load errors are std::runtime_error.
*/
class ConfigLoader {
 public:
  static buildq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static buildq::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Semantic checks the JSON mapping cannot express. Called by both loaders.
  static void Validate(const buildq::runtime::config::RuntimeConfig& config);

 private:
  static buildq::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml);
};

} // namespace buildq::config
