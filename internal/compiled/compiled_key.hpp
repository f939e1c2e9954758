#pragma once

#include <cstdint>
#include <string>

#include "resource/pipeline/v1.hpp"

namespace resource::compiled {

// <uuid>-<platform as 16 hex digits>-v<compiler version>
std::string BlobKey(const resource::pipeline::v1::ResourceKey& key);

// Compiler version 0 means "current".
resource::pipeline::v1::ResourceKey NormalizeKey(const resource::pipeline::v1::ResourceKey& key, uint32_t current_compiler_version);

std::string DescribeKey(const resource::pipeline::v1::ResourceKey& key);

} // namespace resource::compiled
