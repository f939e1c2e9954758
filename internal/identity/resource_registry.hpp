#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "resource/pipeline/v1.hpp"

namespace resource::identity {

using BackendLocation = resource::runtime::config::BackendLocation;

/*
  Process-wide map of ResourceID to the backend hosting it.

  Lifecycle is explicit: Initialize() populates the static entries from
  configuration, Teardown() drops every mapping. Re-registration replaces
  the whole location under the writer lock, so readers always see either
  the old or the new location.
*/
class ResourceRegistry {
 public:
  static ResourceRegistry& Instance();

  void Initialize(const resource::runtime::config::RuntimeConfig& config);
  void Teardown();

  void Register(const resource::pipeline::v1::ResourceID& id, const BackendLocation& location);
  void Unregister(const resource::pipeline::v1::ResourceID& id);

  // Throws util::NotFound for unknown ids.
  BackendLocation Resolve(const resource::pipeline::v1::ResourceID& id) const;

  BackendLocation ResolveOrDefault(const resource::pipeline::v1::ResourceID& id) const;

  size_t Size() const;

 private:
  ResourceRegistry() = default;

  mutable std::shared_mutex                        mutex_;
  std::unordered_map<std::string, BackendLocation> locations_;
  BackendLocation                                  default_location_;
};

// Location derived from the source/compiled sections of a runtime config.
BackendLocation DefaultLocation(const resource::runtime::config::RuntimeConfig& config);

std::string DescribeLocation(const BackendLocation& location);

} // namespace resource::identity
