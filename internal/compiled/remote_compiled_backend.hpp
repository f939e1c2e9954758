#pragma once

#include "config/config.pb.h"
#include "internal/compiled/compiled_backend.hpp"
#include "internal/wire/client.hpp"

namespace resource::compiled {

/*
  Compiled backend proxy to a compiled daemon.

  Eviction is the daemon's business: Evict() is a no-op returning 0 and
  Invalidate() does nothing, the daemon invalidates on source events.
*/
class RemoteCompiledBackend final : public CompiledBackend {
 public:
  RemoteCompiledBackend(resource::runtime::config::Endpoint endpoint, wire::ClientOptions options);

  LookupResult Get(const resource::pipeline::v1::ResourceKey& key) override;

  void Put(const CompiledArtifact& artifact) override;

  uint64_t Evict(const EvictionPolicy& policy) override;

  void Invalidate(const resource::pipeline::v1::ResourceID& id) override;

  // Runs the daemon's compile pipeline for key.
  CompiledArtifact Compile(const resource::pipeline::v1::ResourceKey& key);

 private:
  wire::WireClient client_;
};

} // namespace resource::compiled
