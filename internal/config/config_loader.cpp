#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <string_view>

#include "internal/util/errors.hpp"

namespace hashtax::config {

using hashtax::runtime::config::RuntimeConfig;
using hashtax::util::FileNotFound;
using hashtax::util::InvalidArgument;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // quoted scalars stay strings ("31" is a string, 31 a number)
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw InvalidArgument("Unsupported YAML node");
  }
}

static void Validate(const RuntimeConfig& config) {
  static constexpr std::array<std::string_view, 8> kLevels = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};

  const auto& level = config.logging().level();
  if (!level.empty()) {
    bool known = false;
    for (auto candidate : kLevels) {
      known = known || candidate == level;
    }
    if (!known) {
      throw InvalidArgument("Invalid configuration: unknown logging.level '" + level + "'");
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw FileNotFound("Config file not found: " + path);
  } catch (const std::exception& e) {
    throw InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // empty document: keep defaults
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

} // namespace hashtax::config
