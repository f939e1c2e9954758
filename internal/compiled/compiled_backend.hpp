#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/compiled/compiled_artifact.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::compiled {

enum class LookupStatus {
  kOk,
  kStale,
  kNotFound,
};

struct LookupResult {
  LookupStatus                    status = LookupStatus::kNotFound;
  std::optional<CompiledArtifact> artifact; // set for kOk only
};

struct EvictionPolicy {
  // 0 disables the size bound.
  uint64_t capacity_bytes = 0;
  // 0 disables the age bound.
  std::chrono::milliseconds max_age{0};
};

/*
  Compiled cache abstraction.

  Implementations:
    LocalCompiledBackend   -> blob store + index, LRU eviction
    RemoteCompiledBackend  -> compiled daemon over the wire protocol

  Get never returns kOk for an artifact whose source counter differs
  from the live source counter.
*/
class CompiledBackend {
 public:
  virtual ~CompiledBackend() = default;

  virtual LookupResult Get(const resource::pipeline::v1::ResourceKey& key) = 0;

  virtual void Put(const CompiledArtifact& artifact) = 0;

  // Returns the number of evicted entries.
  virtual uint64_t Evict(const EvictionPolicy& policy) = 0;

  // Drops every entry of a resource.
  virtual void Invalidate(const resource::pipeline::v1::ResourceID& id) = 0;
};

using CompiledBackendPtr = std::shared_ptr<CompiledBackend>;

std::string_view LookupStatusName(LookupStatus status);

} // namespace resource::compiled
