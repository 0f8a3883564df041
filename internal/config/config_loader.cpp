#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace baton::config {

namespace {

using baton::runtime::config::RuntimeConfig;

void ToValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings: level "007" or a bind address is not a number.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  // Enum names (ROLE_MANAGER, TESTING_MODE_FULL, ...) travel as strings and
  // are resolved by the JSON parser against the proto schema.
  value->set_string_value(scalar);
}

void ToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("line " + std::to_string(entry.first.Mark().line + 1) + ": mapping keys must be scalars");
        }
        const auto& key = entry.first.Scalar();
        if (fields->count(key) != 0) {
          throw std::runtime_error("line " + std::to_string(entry.first.Mark().line + 1) + ": duplicate key " + key);
        }
        ToValue(entry.second, &(*fields)[key]);
      }
      return;
    }

    default:
      throw std::runtime_error("line " + std::to_string(node.Mark().line + 1) + ": unsupported YAML node");
  }
}

RuntimeConfig Parse(const YAML::Node& yaml, const std::string& origin) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration " + origin + ": top level must be a mapping");
  }

  google::protobuf::Value root;
  try {
    ToValue(yaml, &root);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid configuration " + origin + ": " + e.what());
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize " + origin + " to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration " + origin + ": " + std::string(status.message()));
  }

  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  return Parse(yaml, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Parse(yaml, "<inline>");
}

} // namespace baton::config
