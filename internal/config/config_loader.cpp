#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace macrelay::config {

namespace {

using macrelay::runtime::config::RuntimeConfig;

constexpr char kDefaultBindAddress[] = "0.0.0.0:50061";

void ToValue(const YAML::Node& node, google::protobuf::Value* out);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  // quoted scalars carry the "!" tag; MACs and numeric portal ids stay strings
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) ToValue(item, list->add_values());
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& kv : node) ToValue(kv.second, &fields[kv.first.Scalar()]);
      return;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void ValidatePortals(const RuntimeConfig& config) {
  std::set<std::string> ids;

  for (const auto& portal : config.portals()) {
    if (portal.id().empty()) {
      throw std::runtime_error("Invalid configuration: portal without id");
    }
    if (!ids.insert(portal.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate portal id " + portal.id());
    }
    if (portal.url().empty()) {
      throw std::runtime_error("Invalid configuration: portal " + portal.id() + " has no url");
    }

    std::set<std::string> macs;
    for (const auto& mac : portal.macs()) {
      if (mac.mac().empty() || !macs.insert(mac.mac()).second) {
        throw std::runtime_error("Invalid configuration: portal " + portal.id() + " has an empty or repeated MAC");
      }
    }
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  google::protobuf::Value tree;
  ToValue(yaml, &tree);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration in " + path + ": " + std::string(status.message()));
  }

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  ValidatePortals(config);

  return config;
}

} // namespace macrelay::config
