#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace failover::config {

namespace {

constexpr const char* kDefaultBindAddress   = "0.0.0.0:10911";
constexpr int32_t     kDefaultQueueCount    = 4;
constexpr uint64_t    kDefaultSendTimeoutMs = 3000;
constexpr uint64_t    kDefaultPullTimeoutMs = 10000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings: "0" must not become a number
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

failover::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  failover::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw failover::util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

} // namespace

failover::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw failover::util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

failover::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw failover::util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(failover::runtime::config::RuntimeConfig* config) {
  auto* broker = config->mutable_broker();
  if (broker->broker_name().empty()) {
    throw failover::util::ConfigurationError("broker.broker_name is required");
  }
  if (broker->broker_id() < 0) {
    throw failover::util::ConfigurationError("broker.broker_id must not be negative");
  }
  if (broker->queue_count() < 0) {
    throw failover::util::ConfigurationError("broker.queue_count must not be negative");
  }
  if (broker->queue_count() == 0) {
    broker->set_queue_count(kDefaultQueueCount);
  }

  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (broker->store_host().empty()) {
    broker->set_store_host(config->server().bind_address());
  }

  auto* remote_client = config->mutable_remote_client();
  if (remote_client->send_timeout_ms() == 0) {
    remote_client->set_send_timeout_ms(kDefaultSendTimeoutMs);
  }
  if (remote_client->pull_timeout_ms() == 0) {
    remote_client->set_pull_timeout_ms(kDefaultPullTimeoutMs);
  }
}

} // namespace failover::config
