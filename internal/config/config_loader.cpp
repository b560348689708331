#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace outflow::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static outflow::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  outflow::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

outflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

outflow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const outflow::runtime::config::RuntimeConfig& config) {
  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  if (config.retry().multiplier() != 0 && config.retry().multiplier() < 1.0) {
    throw std::runtime_error("Invalid configuration: retry.multiplier must be >= 1");
  }

  const auto& cost = config.cost();
  if (cost.has_labor_rate_per_hour() && cost.labor_rate_per_hour() < 0) {
    throw std::runtime_error("Invalid configuration: cost.labor_rate_per_hour must be >= 0");
  }
  if ((cost.has_labor_markup_percent() && cost.labor_markup_percent() < 0) || (cost.has_overhead_percent() && cost.overhead_percent() < 0)
      || (cost.has_tax_percent() && cost.tax_percent() < 0)) {
    throw std::runtime_error("Invalid configuration: cost percentages must be >= 0");
  }

  for (const auto& role : config.approvals().protected_roles()) {
    if (role.empty()) {
      throw std::runtime_error("Invalid configuration: approvals.protected_roles contains an empty role");
    }
  }
}

} // namespace outflow::config
