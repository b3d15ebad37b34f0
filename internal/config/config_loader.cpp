#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace upload::config {

namespace {

constexpr int64_t  kDefaultTtlSeconds          = 24 * 60 * 60;
constexpr int64_t  kDefaultRetentionSeconds    = 7 * 24 * 60 * 60;
constexpr int64_t  kDefaultSweepSeconds        = 60;
constexpr uint32_t kDefaultChunkSize           = 1024 * 1024;
constexpr uint32_t kDefaultMaxChunkSize        = 16 * 1024 * 1024;
constexpr uint32_t kDefaultFinalizeAttempts    = 2;
constexpr uint32_t kDefaultMalformedThreshold  = 8;
constexpr uint32_t kDefaultPostgresConnections = 4;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("86400s", "0.0.0.0:50061")
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
  }
}

upload::runtime::config::RuntimeConfig ParseNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  // an empty document means "all defaults"
  if (json_value.kind_case() == google::protobuf::Value::kNullValue) {
    json_value.mutable_struct_value();
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  upload::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

void DefaultDuration(google::protobuf::Duration* duration, int64_t seconds) {
  if (duration->seconds() == 0 && duration->nanos() == 0) duration->set_seconds(seconds);
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

upload::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

upload::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

void ConfigLoader::ApplyDefaults(upload::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* database = config.mutable_database();
  if (database->backend_case() == upload::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(kDefaultPostgresConnections);
  }

  auto* storage = config.mutable_storage();
  if (storage->staging_root().empty()) storage->set_staging_root("/tmp/upload-manager/staging");
  if (storage->blob_root().empty()) storage->set_blob_root("/tmp/upload-manager/blobs");

  auto* sessions = config.mutable_sessions();
  DefaultDuration(sessions->mutable_ttl(), kDefaultTtlSeconds);
  DefaultDuration(sessions->mutable_retention(), kDefaultRetentionSeconds);
  DefaultDuration(sessions->mutable_sweep_interval(), kDefaultSweepSeconds);
  if (sessions->default_chunk_size() == 0) sessions->set_default_chunk_size(kDefaultChunkSize);
  if (sessions->max_chunk_size() == 0) sessions->set_max_chunk_size(kDefaultMaxChunkSize);
  if (sessions->max_finalize_attempts() == 0) sessions->set_max_finalize_attempts(kDefaultFinalizeAttempts);

  auto* channel = config.mutable_channel();
  if (channel->malformed_message_threshold() == 0) channel->set_malformed_message_threshold(kDefaultMalformedThreshold);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const upload::runtime::config::RuntimeConfig& config) {
  const auto& sessions = config.sessions();
  if (sessions.ttl().seconds() <= 0) {
    throw std::runtime_error("Invalid configuration: sessions.ttl must be positive");
  }
  if (sessions.sweep_interval().seconds() <= 0 && sessions.sweep_interval().nanos() <= 0) {
    throw std::runtime_error("Invalid configuration: sessions.sweep_interval must be positive");
  }
  if (sessions.default_chunk_size() > sessions.max_chunk_size()) {
    throw std::runtime_error("Invalid configuration: sessions.default_chunk_size exceeds sessions.max_chunk_size");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  const double ratio = config.observability().trace_sample_ratio();
  if (ratio < 0.0 || ratio > 1.0) {
    throw std::runtime_error("Invalid configuration: observability.trace_sample_ratio must be within [0, 1]");
  }
  if (config.storage().staging_root() == config.storage().blob_root()) {
    throw std::runtime_error("Invalid configuration: storage.staging_root and storage.blob_root must differ");
  }
}

} // namespace upload::config
