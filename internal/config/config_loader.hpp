#pragma once

#include <string>

#include "config/config.pb.h"

namespace macrelay::config {

/*
  Reads the gateway YAML into RuntimeConfig.

  The document goes through protobuf JSON parsing, so unknown keys fail
  the load. Quoted scalars always stay strings. Portals are checked for
  unique ids, a url, and distinct non-empty MACs.
*/
class ConfigLoader {
 public:
  static macrelay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace macrelay::config
