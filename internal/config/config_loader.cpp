#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace workledger::config {

namespace rc = workledger::runtime::config;

namespace {

constexpr const char* kDefaultBindAddress         = "0.0.0.0:50061";
constexpr uint32_t    kDefaultMaxAttempts         = 3;
constexpr uint32_t    kDefaultCleanupDays         = 30;
constexpr int64_t     kDefaultReaperIntervalSec   = 30;
constexpr int64_t     kDefaultProcessingTimeout   = 15 * 60;
constexpr uint32_t    kDefaultReaperBatchLimit    = 100;
constexpr uint32_t    kDefaultPostgresConnections = 8;
constexpr int64_t     kDefaultStartingCredits     = 100;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("30s", "0100")
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

rc::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  rc::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsDefined() && !yaml.IsNull()) {
    if (!yaml.IsMap()) throw std::runtime_error("Invalid configuration: top level must be a mapping");

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

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

bool IsNegative(const google::protobuf::Duration& d) {
  return d.seconds() < 0 || d.nanos() < 0;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

rc::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

rc::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(rc::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(kDefaultPostgresConnections);
  }

  if (config.job_queue().default_max_attempts() == 0) {
    config.mutable_job_queue()->set_default_max_attempts(kDefaultMaxAttempts);
  }
  if (config.job_queue().cleanup_older_than_days() == 0) {
    config.mutable_job_queue()->set_cleanup_older_than_days(kDefaultCleanupDays);
  }

  auto* reaper = config.mutable_reaper();
  if (IsUnset(reaper->interval())) reaper->mutable_interval()->set_seconds(kDefaultReaperIntervalSec);
  if (IsUnset(reaper->processing_timeout())) reaper->mutable_processing_timeout()->set_seconds(kDefaultProcessingTimeout);
  if (reaper->batch_limit() == 0) reaper->set_batch_limit(kDefaultReaperBatchLimit);

  if (!config.ledger().has_default_starting_credits()) {
    config.mutable_ledger()->set_default_starting_credits(kDefaultStartingCredits);
  }
}

void ConfigLoader::Validate(const rc::RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.job_queue().default_max_attempts() > 100) {
    throw std::runtime_error("Invalid configuration: job_queue.default_max_attempts must be in [1, 100]");
  }
  if (IsNegative(config.job_queue().retry_backoff())) {
    throw std::runtime_error("Invalid configuration: job_queue.retry_backoff must not be negative");
  }
  if (IsNegative(config.reaper().interval()) || IsNegative(config.reaper().processing_timeout())) {
    throw std::runtime_error("Invalid configuration: reaper durations must not be negative");
  }
  if (config.ledger().default_starting_credits() < 0) {
    throw std::runtime_error("Invalid configuration: ledger.default_starting_credits must be >= 0");
  }
}

} // namespace workledger::config
