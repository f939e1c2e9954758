#include "resource_registry.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::identity {

using resource::pipeline::v1::ResourceID;

ResourceRegistry& ResourceRegistry::Instance() {
  static ResourceRegistry instance;
  return instance;
}

void ResourceRegistry::Initialize(const resource::runtime::config::RuntimeConfig& config) {
  std::unordered_map<std::string, BackendLocation> locations;
  for (const auto& entry : config.registry().entries()) {
    locations[util::ParseResourceID(entry.id()).value()] = entry.location();
  }

  std::unique_lock lock(mutex_);
  locations_        = std::move(locations);
  default_location_ = DefaultLocation(config);
  RESOURCE_LOG_DEBUG("resource registry initialized", {observability::IntField("entries", static_cast<int64_t>(locations_.size()))});
}

void ResourceRegistry::Teardown() {
  std::unique_lock lock(mutex_);
  locations_.clear();
  default_location_.Clear();
}

void ResourceRegistry::Register(const ResourceID& id, const BackendLocation& location) {
  std::unique_lock lock(mutex_);
  locations_[id.value()] = location;
}

void ResourceRegistry::Unregister(const ResourceID& id) {
  std::unique_lock lock(mutex_);
  locations_.erase(id.value());
}

BackendLocation ResourceRegistry::Resolve(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  auto             it = locations_.find(id.value());
  if (it == locations_.end()) throw util::NotFound("resource not registered: " + util::Describe(id));
  return it->second;
}

BackendLocation ResourceRegistry::ResolveOrDefault(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  auto             it = locations_.find(id.value());
  if (it == locations_.end()) {
    if (default_location_.kind_case() == BackendLocation::KIND_NOT_SET) {
      throw util::NotFound("resource not registered and no default location: " + util::Describe(id));
    }
    return default_location_;
  }
  return it->second;
}

size_t ResourceRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return locations_.size();
}

BackendLocation DefaultLocation(const resource::runtime::config::RuntimeConfig& config) {
  BackendLocation location;
  if (config.source().has_remote() || config.compiled().has_remote()) {
    auto* remote = location.mutable_remote();
    if (config.source().has_remote()) *remote->mutable_source() = config.source().remote();
    if (config.compiled().has_remote()) *remote->mutable_compiled() = config.compiled().remote();
    return location;
  }
  if (config.source().has_local()) {
    location.mutable_local()->set_root_path(config.source().local().root_path());
  }
  return location;
}

std::string DescribeLocation(const BackendLocation& location) {
  switch (location.kind_case()) {
    case BackendLocation::kLocal:
      return "local:" + location.local().root_path();
    case BackendLocation::kRemote:
      return "remote:" + location.remote().source().host() + ":" + std::to_string(location.remote().source().port()) + "," +
             location.remote().compiled().host() + ":" + std::to_string(location.remote().compiled().port());
    case BackendLocation::KIND_NOT_SET:
      break;
  }
  return "unset";
}

} // namespace resource::identity
