#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <regex>

#include "internal/util/errors.hpp"

namespace netcrawl::config {

using netcrawl::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("1234", 'true') stay strings
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
      throw util::ConfigError("unsupported YAML node");
  }
}

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) return config;
  if (!yaml.IsMap()) throw util::ConfigError("configuration root must be a mapping");

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("invalid configuration: " + std::string(status.message()));
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
    throw util::ConfigError("failed to load YAML config " + path + ": " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ApplyDefaults(RuntimeConfig& config) {
  auto* crawl = config.mutable_crawl();
  if (crawl->workers() == 0) crawl->set_workers(4);
  if (crawl->default_family().empty()) crawl->set_default_family("cisco_ios");

  auto* session = config.mutable_session();
  if (!session->has_connect_timeout()) session->mutable_connect_timeout()->set_seconds(20);
  if (!session->has_command_timeout()) session->mutable_command_timeout()->set_seconds(30);
  if (!session->has_retry_backoff()) session->mutable_retry_backoff()->set_nanos(500 * 1000 * 1000);

  if (!config.connector().has_replay() && !config.connector().has_exec()) {
    config.mutable_connector()->mutable_exec()->set_command_template(
        "sshpass -e ssh -o StrictHostKeyChecking=no -o ConnectTimeout={timeout} -l {username} {host} {command}");
  }

  if (!config.database().has_memory() && !config.database().has_sqlite()) {
    config.mutable_database()->mutable_sqlite()->set_path("network_devices.db");
  }

  auto* output = config.mutable_output();
  if (output->devices_csv().empty()) output->set_devices_csv("network_inventory.csv");
  if (output->edges_csv().empty()) output->set_edges_csv("network_edges.csv");

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
}

void ValidateConfig(const RuntimeConfig& config) {
  const auto& crawl = config.crawl();
  if (crawl.seed_device().empty()) throw util::ConfigError("crawl.seed_device is required");
  if (crawl.workers() == 0) throw util::ConfigError("crawl.workers must be at least 1");

  if (config.credentials().username().empty()) throw util::ConfigError("credentials.username is required");
  if (ResolvePassword(config).empty()) {
    throw util::ConfigError("credentials.password (or an environment variable named by credentials.password_env) is required");
  }

  for (const auto& entry : crawl.family_overrides()) {
    if (entry.family().empty()) throw util::ConfigError("family override '" + entry.platform_pattern() + "' names no family");
    try {
      std::regex compiled(entry.platform_pattern());
    } catch (const std::regex_error& e) {
      throw util::ConfigError("invalid family override pattern '" + entry.platform_pattern() + "': " + e.what());
    }
  }

  if (config.connector().has_exec() && config.connector().exec().command_template().find("{command}") == std::string::npos) {
    throw util::ConfigError("connector.exec.command_template must contain {command}");
  }
  if (config.connector().has_replay() && config.connector().replay().capture_dir().empty()) {
    throw util::ConfigError("connector.replay.capture_dir is required");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ConfigError("database.sqlite.path is required");
  }
}

std::string ResolvePassword(const RuntimeConfig& config) {
  const auto& credentials = config.credentials();
  if (!credentials.password().empty()) return credentials.password();
  if (!credentials.password_env().empty()) {
    if (const char* value = std::getenv(credentials.password_env().c_str())) return value;
  }
  return {};
}

} // namespace netcrawl::config
