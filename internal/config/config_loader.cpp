#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace resource::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
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
      throw util::InvalidState("unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

resource::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidState("failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidState("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  resource::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidState("invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(resource::runtime::config::RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->max_frame_bytes() == 0) server->set_max_frame_bytes(kDefaultMaxFrameBytes);

  auto* remote = config->mutable_remote();
  if (remote->connect_timeout_ms() == 0) remote->set_connect_timeout_ms(kDefaultConnectTimeoutMs);
  if (remote->io_timeout_ms() == 0) remote->set_io_timeout_ms(kDefaultIoTimeoutMs);
  if (remote->max_retries() == 0) remote->set_max_retries(kDefaultMaxRetries);
  if (remote->retry_backoff_ms() == 0) remote->set_retry_backoff_ms(kDefaultRetryBackoffMs);
  if (remote->max_frame_bytes() == 0) remote->set_max_frame_bytes(kDefaultMaxFrameBytes);

  auto* events = config->mutable_events();
  if (events->queue_capacity() == 0) events->set_queue_capacity(kDefaultQueueCapacity);

  auto* pipeline = config->mutable_pipeline();
  if (pipeline->compiler_version() == 0) pipeline->set_compiler_version(1);
}

} // namespace resource::config
