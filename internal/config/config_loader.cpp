#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace flotilla::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars ("8080", 'true') stay strings
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
    case YAML::NodeType::Undefined:
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

static flotilla::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  flotilla::runtime::config::RuntimeConfig config;

  // an empty document is an all-defaults config
  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

flotilla::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

flotilla::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(flotilla::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* controller = config.mutable_controller();
  if (controller->backend_url_scheme().empty()) {
    controller->set_backend_url_scheme(kDefaultUrlScheme);
  }

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->drone_staleness_seconds() == 0) {
    scheduler->set_drone_staleness_seconds(kDefaultStalenessSec);
  }
  if (scheduler->watchdog_interval_ms() == 0) {
    scheduler->set_watchdog_interval_ms(kDefaultWatchdogMs);
  }
  if (scheduler->node_sweep_interval_ms() == 0) {
    scheduler->set_node_sweep_interval_ms(kDefaultNodeSweepMs);
  }
  if (scheduler->event_retention_max_entries() == 0) {
    scheduler->set_event_retention_max_entries(kDefaultEventRetention);
  }

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(16);
  }
}

void ConfigLoader::Validate(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must not be empty");
  }

  const auto& scheme = config.controller().backend_url_scheme();
  if (scheme.find("://") != std::string::npos || scheme.find('/') != std::string::npos) {
    throw std::invalid_argument("controller.backend_url_scheme must be a bare scheme such as 'https'");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && level != "trace" && level != "debug" && level != "info" && level != "warn" && level != "warning" &&
      level != "error" && level != "err" && level != "critical" && level != "off") {
    throw std::invalid_argument("logging.level '" + level + "' is not a known level");
  }
}

} // namespace flotilla::config
