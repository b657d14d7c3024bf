#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/util/errors.hpp"

namespace modelplan::config {

using modelplan::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
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
      throw util::ParseError("Unsupported YAML node");
  }
}

static RuntimeConfig ParseNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // empty document
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ParseError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ParseError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ParseError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::ParseError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

// ------------------------------------------------------------
// Typed views
// ------------------------------------------------------------

planner::PlannerConfig ToPlannerConfig(const modelplan::runtime::config::PlannerConfig& proto) {
  planner::PlannerConfig config;
  if (proto.has_default_lookback_days())
    config.default_lookback_days = proto.default_lookback_days();
  if (proto.has_cost_per_compute_second())
    config.cost_per_compute_second = proto.cost_per_compute_second();
  if (proto.has_skip_cosmetic_changes())
    config.skip_cosmetic_changes = proto.skip_cosmetic_changes();
  if (proto.has_default_estimated_seconds())
    config.default_estimated_seconds = proto.default_estimated_seconds();

  config.Validate();
  return config;
}

simulation::SimulationConfig ToSimulationConfig(const modelplan::runtime::config::SimulationConfig& proto) {
  simulation::SimulationConfig config;
  if (proto.has_max_depth())
    config.max_depth = proto.max_depth();

  config.Validate();
  return config;
}

} // namespace modelplan::config
