#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace shipyard::config {

using shipyard::runtime::config::RuntimeConfig;
using shipyard::util::ConfigurationError;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static bool HasHttpScheme(const std::string& url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  ResolveSecrets(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ResolveSecrets(RuntimeConfig& config) {
  auto* gateway = config.mutable_gateway();
  if (!gateway->token().empty() || gateway->token_env().empty()) {
    return;
  }
  if (const char* token = std::getenv(gateway->token_env().c_str())) {
    gateway->set_token(token);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  auto* gateway = config.mutable_gateway();
  if (gateway->timeout_ms() == 0) {
    gateway->set_timeout_ms(30000);
  }
  while (gateway->url().size() > 1 && gateway->url().back() == '/') {
    gateway->mutable_url()->pop_back();
  }

  auto* deploy = config.mutable_deploy();
  if (deploy->projects_dir().empty()) {
    deploy->set_projects_dir("/home/pi/projects");
  }
  if (deploy->log_dir().empty()) {
    deploy->set_log_dir("/tmp");
  }
  if (deploy->log_tail_lines() == 0) {
    deploy->set_log_tail_lines(300);
  }
  if (deploy->freshness_window_s() == 0) {
    deploy->set_freshness_window_s(30);
  }
  if (deploy->default_strategy().empty()) {
    deploy->set_default_strategy("pull_rebuild");
  }
  if (deploy->stream_poll_interval_ms() == 0) {
    deploy->set_stream_poll_interval_ms(1000);
  }
  if (deploy->stream_max_polls() == 0) {
    deploy->set_stream_max_polls(600);
  }

  if (config.allowlist().path().empty()) {
    config.mutable_allowlist()->set_path("./data/allowlist.json");
  }

  if (config.notifications().username().empty()) {
    config.mutable_notifications()->set_username("shipyard");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& gateway = config.gateway();
  if (gateway.url().empty()) {
    throw ConfigurationError("gateway.url is not configured");
  }
  if (!HasHttpScheme(gateway.url())) {
    throw ConfigurationError("gateway.url must start with http:// or https://");
  }
  if (gateway.token().empty()) {
    throw ConfigurationError("gateway token is not configured");
  }

  const auto& log_dir = config.deploy().log_dir();
  if (log_dir.empty() || log_dir.front() != '/') {
    throw ConfigurationError("deploy.log_dir must be an absolute path");
  }

  const auto& webhook = config.notifications().webhook_url();
  if (!webhook.empty() && !HasHttpScheme(webhook)) {
    throw ConfigurationError("notifications.webhook_url must start with http:// or https://");
  }
}

} // namespace shipyard::config
