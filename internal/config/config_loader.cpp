#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace settlement::config {

namespace {

// Integers above this lose precision as JSON numbers (doubles); they are
// passed as strings, which the protobuf JSON parser accepts for int64.
constexpr std::size_t kMaxExactDigits = 15;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

bool IsInteger(const std::string& scalar) {
  if (scalar.empty()) return false;
  std::size_t start = scalar[0] == '-' ? 1 : 0;
  if (start == scalar.size()) return false;
  for (std::size_t i = start; i < scalar.size(); ++i) {
    if (scalar[i] < '0' || scalar[i] > '9') return false;
  }
  return true;
}

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // explicitly quoted: keep as written
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (IsInteger(scalar_value) && scalar_value.size() > kMaxExactDigits) {
    value->set_string_value(scalar_value);
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
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

settlement::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  settlement::runtime::config::RuntimeConfig config;

  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

settlement::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

settlement::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(settlement::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().backend_case() == settlement::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* coordinator = config.mutable_coordinator();
  if (!coordinator->has_request_timeout()) {
    coordinator->mutable_request_timeout()->set_seconds(7 * 24 * 60 * 60);
  }

  auto* bidding = config.mutable_bidding();
  if (bidding->min_duration_hours() == 0) bidding->set_min_duration_hours(1);
  if (bidding->max_duration_hours() == 0) bidding->set_max_duration_hours(168);

  auto* verification = config.mutable_verification();
  if (verification->rate_denominator() == 0) verification->set_rate_denominator(10000);
  if (verification->tolerance_denominator() == 0) {
    verification->set_tolerance_denominator(100);
    if (verification->tolerance_numerator() == 0) verification->set_tolerance_numerator(95);
  }
}

} // namespace settlement::config
