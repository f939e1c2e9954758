#include "properties.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace resource::source {

namespace {

std::string Lookup(const Properties& properties, const char* key) {
  auto it = properties.find(key);
  return it == properties.end() ? std::string{} : it->second;
}

} // namespace

std::string TypeOf(const Properties& properties) {
  return Lookup(properties, kTypeProperty);
}

std::string NamespaceOf(const Properties& properties) {
  return Lookup(properties, kNamespaceProperty);
}

std::string SerializeProperties(const Properties& properties) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : properties) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) throw std::runtime_error("failed to serialize properties: " + std::string(status.message()));
  return json;
}

Properties DeserializeProperties(const std::string& json) {
  Properties properties;
  if (json.empty()) return properties;

  google::protobuf::Struct as_struct;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &as_struct);
  if (!status.ok()) throw util::InvalidState("corrupt properties row: " + std::string(status.message()));

  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      properties[key] = value.string_value();
    }
  }
  return properties;
}

Properties ToProperties(const google::protobuf::Map<std::string, std::string>& map) {
  return Properties(map.begin(), map.end());
}

void CopyProperties(const Properties& properties, google::protobuf::Map<std::string, std::string>* map) {
  map->clear();
  for (const auto& [key, value] : properties) {
    (*map)[key] = value;
  }
}

} // namespace resource::source
