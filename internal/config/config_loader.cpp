#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace usbforge::config {

using usbforge::runtime::config::RuntimeConfig;
using google::protobuf::util::TimeUtil;

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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidArgument("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// Only absent durations are defaulted; an explicit "0s" is kept.
static void DefaultDuration(bool present, google::protobuf::Duration* d, int64_t seconds) {
  if (!present) *d = TimeUtil::SecondsToDuration(seconds);
}

static bool IsPositive(const google::protobuf::Duration& d) {
  return d.seconds() > 0 || (d.seconds() == 0 && d.nanos() > 0);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->backend_case() == usbforge::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_postgres() && database->postgres().pool_size() == 0) {
    database->mutable_postgres()->set_pool_size(4);
  }

  auto* worker = config.mutable_worker();
  if (const char* id = std::getenv("USBFORGE_WORKER_ID"); id && *id) {
    worker->set_worker_id(id);
  }
  DefaultDuration(worker->has_lease_duration(), worker->mutable_lease_duration(), 300);
  DefaultDuration(worker->has_shutdown_grace(), worker->mutable_shutdown_grace(), 30);
  DefaultDuration(worker->has_reaper_interval(), worker->mutable_reaper_interval(), 60);
  if (!IsPositive(worker->poll_interval())) *worker->mutable_poll_interval() = TimeUtil::MillisecondsToDuration(5000);
  if (worker->max_concurrent_jobs() == 0) worker->set_max_concurrent_jobs(1);
  if (worker->extension_threshold_percent() == 0) worker->set_extension_threshold_percent(50);
  if (worker->max_attempts() == 0) worker->set_max_attempts(3);

  auto* verification = config.mutable_execution()->mutable_verification();
  if (verification->strategy() == usbforge::runtime::config::VERIFICATION_STRATEGY_UNSPECIFIED) {
    verification->set_strategy(usbforge::runtime::config::VERIFICATION_STRATEGY_SAMPLING);
  }
  if (verification->sample_percentage() == 0) verification->set_sample_percentage(20.0);
  if (verification->min_sample_size() == 0) verification->set_min_sample_size(10);

  auto* retention = config.mutable_retention();
  DefaultDuration(retention->has_interval(), retention->mutable_interval(), 3600);

  auto* observability = config.mutable_observability();
  if (observability->transport() == usbforge::runtime::config::OTLP_TRANSPORT_UNSPECIFIED) {
    observability->set_transport(usbforge::runtime::config::OTLP_TRANSPORT_GRPC);
  }
  if (observability->trace_processor() == usbforge::runtime::config::TRACE_PROCESSOR_UNSPECIFIED) {
    observability->set_trace_processor(usbforge::runtime::config::TRACE_PROCESSOR_BATCH);
  }
  DefaultDuration(observability->has_metrics_export_interval(), observability->mutable_metrics_export_interval(), 10);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::InvalidArgument("database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri is required");
  }

  const auto& worker = config.worker();
  if (!IsPositive(worker.lease_duration())) {
    throw util::InvalidArgument("worker.lease_duration must be positive");
  }
  if (worker.extension_threshold_percent() >= 100) {
    throw util::InvalidArgument("worker.extension_threshold_percent must be in 1..99");
  }
  if (worker.shutdown_grace().seconds() < 0 || worker.shutdown_grace().nanos() < 0 || worker.reaper_interval().seconds() < 0 ||
      worker.reaper_interval().nanos() < 0) {
    throw util::InvalidArgument("worker durations must not be negative");
  }

  const auto& verification = config.execution().verification();
  if (verification.sample_percentage() < 0 || verification.sample_percentage() > 100) {
    throw util::InvalidArgument("execution.verification.sample_percentage must be in 0..100");
  }

  const auto& retention = config.retention();
  const bool  retention_enabled = retention.log_retention_days() > 0 || retention.job_retention_days() > 0;
  if (retention_enabled && !IsPositive(retention.interval())) {
    throw util::InvalidArgument("retention.interval must be positive when retention is enabled");
  }

  if (!IsPositive(config.observability().metrics_export_interval())) {
    throw util::InvalidArgument("observability.metrics_export_interval must be positive");
  }

  const auto& logging = config.logging();
  if (!logging.level().empty()) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};
    bool known = false;
    for (const char* level : kLevels) known = known || logging.level() == level;
    if (!known) throw util::InvalidArgument("logging.level '" + logging.level() + "' is not a log level");
  }
}

} // namespace usbforge::config
