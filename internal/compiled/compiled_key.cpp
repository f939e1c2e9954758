#include "compiled_key.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::compiled {

std::string BlobKey(const resource::pipeline::v1::ResourceKey& key) {
  if (key.id().value().size() != 16) throw util::InvalidState("resource key has an invalid id");

  char platform[17];
  std::snprintf(platform, sizeof(platform), "%016llx", static_cast<unsigned long long>(key.platform()));
  return util::Describe(key.id()) + "-" + platform + "-v" + std::to_string(key.compiler_version());
}

resource::pipeline::v1::ResourceKey NormalizeKey(const resource::pipeline::v1::ResourceKey& key, uint32_t current_compiler_version) {
  auto normalized = key;
  if (normalized.compiler_version() == 0) normalized.set_compiler_version(current_compiler_version);
  return normalized;
}

std::string DescribeKey(const resource::pipeline::v1::ResourceKey& key) {
  return util::Describe(key.id()) + "@" + std::to_string(key.platform()) + "/v" + std::to_string(key.compiler_version());
}

} // namespace resource::compiled
