#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace routebid::config {

namespace {

using routebid::runtime::config::RuntimeConfig;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  if (!scalar.empty()) {
    char*        endptr  = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
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
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*fields)[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

std::chrono::milliseconds OrDefault(const google::protobuf::Duration& d, std::chrono::milliseconds fallback, const char* name) {
  const auto value = util::FromProto(d);
  if (value.count() < 0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + name + " must not be negative");
  }
  return value.count() == 0 ? fallback : value;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

lifecycle::BiddingPolicy ToBiddingPolicy(const RuntimeConfig& config) {
  const lifecycle::BiddingPolicy defaults;
  const auto&                    bidding = config.bidding();

  lifecycle::BiddingPolicy policy;
  policy.base_window      = OrDefault(bidding.base_window(), defaults.base_window, "bidding.base_window");
  policy.extension_window = OrDefault(bidding.extension_window(), defaults.extension_window, "bidding.extension_window");
  policy.max_extensions   = bidding.max_extensions() == 0 ? defaults.max_extensions : bidding.max_extensions();
  policy.warning_lead     = OrDefault(bidding.warning_lead(), defaults.warning_lead, "bidding.warning_lead");
  return policy;
}

lock::LockOptions ToLockOptions(const RuntimeConfig& config) {
  const lock::LockOptions defaults;
  const auto&             locking = config.locking();

  lock::LockOptions options;
  options.acquire_timeout = OrDefault(locking.acquire_timeout(), defaults.acquire_timeout, "locking.acquire_timeout");
  options.max_attempts    = locking.max_attempts() == 0 ? defaults.max_attempts : locking.max_attempts();
  options.retry_backoff   = OrDefault(locking.retry_backoff(), defaults.retry_backoff, "locking.retry_backoff");
  return options;
}

std::chrono::milliseconds SweepInterval(const RuntimeConfig& config) {
  return OrDefault(config.scheduler().sweep_interval(), kDefaultSweepInterval, "scheduler.sweep_interval");
}

} // namespace routebid::config
