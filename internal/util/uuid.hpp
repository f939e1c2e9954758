#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

#include "resource/pipeline/v1.hpp"

namespace resource::util {

/*
  UUID helpers

  ResourceID uses raw 16 byte RFC4122 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// protobuf helpers
resource::pipeline::v1::ResourceID ToProto(const UUID& id);
UUID                               FromProto(const resource::pipeline::v1::ResourceID& id);

resource::pipeline::v1::ResourceID NewResourceID();
resource::pipeline::v1::ResourceID ParseResourceID(const std::string& str);

// Dashed text form, or "<invalid>" for ids that are not 16 bytes.
std::string Describe(const resource::pipeline::v1::ResourceID& id);

} // namespace resource::util
