#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace claims::config {

namespace rc = claims::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings ("300s", "42").
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        endptr  = nullptr;
  const double numeric = strtod(scalar.c_str(), &endptr);
  if (!scalar.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric);
    return;
  }

  value->set_string_value(scalar);
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
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static rc::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  rc::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a map");
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
  return config;
}

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

namespace {

std::int64_t DurationMs(const google::protobuf::Duration& d, const char* field) {
  const auto ms = google::protobuf::util::TimeUtil::DurationToMilliseconds(d);
  if (ms < 0) {
    throw std::invalid_argument(std::string(field) + " must not be negative");
  }
  return ms;
}

std::uint64_t PositiveMs(const google::protobuf::Duration& d, const char* field) {
  const auto ms = DurationMs(d, field);
  if (ms == 0) {
    throw std::invalid_argument(std::string(field) + " must be positive");
  }
  return static_cast<std::uint64_t>(ms);
}

service::ExpiryAction ToExpiryAction(rc::ExpiryAction action, service::ExpiryAction fallback) {
  switch (action) {
    case rc::EXPIRY_ACTION_REQUEUE:
      return service::ExpiryAction::kRequeue;
    case rc::EXPIRY_ACTION_EXPIRE:
      return service::ExpiryAction::kExpire;
    default:
      return fallback;
  }
}

} // namespace

service::ServiceOptions ToServiceOptions(const rc::RuntimeConfig& config) {
  service::ServiceOptions out;
  const auto&             claims = config.claims();

  if (claims.has_agent_ttl()) out.agent_ttl_ms = PositiveMs(claims.agent_ttl(), "claims.agent_ttl");
  if (claims.has_human_ttl()) out.human_ttl_ms = PositiveMs(claims.human_ttl(), "claims.human_ttl");
  if (claims.has_max_steal_count()) out.max_steal_count = claims.max_steal_count();
  out.requeue_on_abandon = claims.requeue_on_abandon();
  out.agent_expiry       = ToExpiryAction(claims.agent_expiry(), out.agent_expiry);
  out.human_expiry       = ToExpiryAction(claims.human_expiry(), out.human_expiry);
  return out;
}

coordination::WorkStealingOptions ToWorkStealingOptions(const rc::RuntimeConfig& config) {
  coordination::WorkStealingOptions out;
  const auto&                       ws = config.work_stealing();

  if (ws.has_enabled()) out.enabled = ws.enabled();
  if (ws.has_interval()) out.interval = std::chrono::milliseconds(PositiveMs(ws.interval(), "work_stealing.interval"));
  if (ws.has_idle_threshold()) out.idle_threshold_ms = static_cast<std::uint64_t>(DurationMs(ws.idle_threshold(), "work_stealing.idle_threshold"));
  if (ws.has_stale_threshold()) {
    out.stale_threshold_ms = static_cast<std::uint64_t>(DurationMs(ws.stale_threshold(), "work_stealing.stale_threshold"));
  }
  out.allow_cross_domain   = ws.allow_cross_domain();
  out.max_steals_per_cycle = ws.max_steals_per_cycle();
  if (ws.has_cycle_deadline()) out.cycle_deadline = std::chrono::milliseconds(DurationMs(ws.cycle_deadline(), "work_stealing.cycle_deadline"));
  return out;
}

coordination::ExpiryOptions ToExpiryOptions(const rc::RuntimeConfig& config) {
  coordination::ExpiryOptions out;
  const auto&                 expiry = config.expiry();

  if (expiry.has_enabled()) out.enabled = expiry.enabled();
  if (expiry.has_interval()) out.interval = std::chrono::milliseconds(PositiveMs(expiry.interval(), "expiry.interval"));
  if (expiry.has_sweep_deadline()) out.sweep_deadline = std::chrono::milliseconds(DurationMs(expiry.sweep_deadline(), "expiry.sweep_deadline"));
  return out;
}

} // namespace claims::config
