#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace logship::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings: license keys may look numeric
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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
      throw util::ConfigError("Unsupported YAML node");
  }
}

static void OverrideFromEnv(const char* name, std::string* target) {
  if (const char* value = std::getenv(name)) {
    if (*value != '\0') {
      *target = value;
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

logship::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  logship::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults configuration
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(logship::runtime::config::RuntimeConfig* config) {
  auto* ingest = config->mutable_ingest();
  OverrideFromEnv("LICENSE_KEY", ingest->mutable_license_key());
  OverrideFromEnv("NR_REGION", ingest->mutable_region());

  auto* invocation = config->mutable_invocation();
  OverrideFromEnv("AWS_LAMBDA_FUNCTION_NAME", invocation->mutable_function_name());
  OverrideFromEnv("AWS_LAMBDA_LOG_GROUP_NAME", invocation->mutable_log_group_name());
  OverrideFromEnv("AWS_LAMBDA_LOG_STREAM_NAME", invocation->mutable_log_stream_name());
}

} // namespace logship::config
