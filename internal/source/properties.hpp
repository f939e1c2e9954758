#pragma once

#include <google/protobuf/map.h>

#include <map>
#include <string>

namespace resource::source {

// Property map of a source resource. Ordered, so iteration is canonical.
using Properties = std::map<std::string, std::string>;

inline constexpr const char* kTypeProperty      = "type";
inline constexpr const char* kNamespaceProperty = "namespace";

std::string TypeOf(const Properties& properties);
std::string NamespaceOf(const Properties& properties);

// protobuf Struct JSON, as stored in the metadata repository.
std::string SerializeProperties(const Properties& properties);
Properties  DeserializeProperties(const std::string& json);

Properties ToProperties(const google::protobuf::Map<std::string, std::string>& map);
void       CopyProperties(const Properties& properties, google::protobuf::Map<std::string, std::string>* map);

} // namespace resource::source
