#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

#include "internal/compiled/compiled_backend.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/source/source_backend.hpp"
#include "internal/storage/storage_backend.hpp"

namespace resource::compiled {

/*
  Compiled cache on local storage.

    artifact bytes  -> blob store, key = BlobKey(ResourceKey)
    index rows      -> metadata repository
    recency         -> in-memory LRU list, rebuilt from last access
                       times by Hydrate()

  Staleness is decided against the live counter of the source backend
  on every Get. Put evicts least recently used entries when the
  configured capacity is exceeded, never the entry just written.
*/
class LocalCompiledBackend final : public CompiledBackend {
 public:
  LocalCompiledBackend(storage::StorageBackendPtr store, std::shared_ptr<db::Repository> repository, source::SourceBackendPtr source,
                       uint32_t compiler_version, EvictionPolicy policy);

  void Hydrate();

  LookupResult Get(const resource::pipeline::v1::ResourceKey& key) override;

  void Put(const CompiledArtifact& artifact) override;

  uint64_t Evict(const EvictionPolicy& policy) override;

  void Invalidate(const resource::pipeline::v1::ResourceID& id) override;

  uint64_t OccupancyBytes() const;
  size_t   EntryCount() const;

 private:
  struct Entry {
    db::model::CompiledRow           row;
    std::list<std::string>::iterator lru;
  };

  // Caller holds mutex_.
  void     Track(db::model::CompiledRow row);
  void     DropLocked(const std::string& key);
  uint64_t EvictLocked(const EvictionPolicy& policy, const std::optional<std::string>& protect);
  void     PublishOccupancyLocked() const;

  storage::StorageBackendPtr       store_;
  std::shared_ptr<db::Repository>  repository_;
  source::SourceBackendPtr         source_;
  const uint32_t                   compiler_version_;
  const EvictionPolicy             policy_;

  mutable std::mutex                                     mutex_;
  std::list<std::string>                                 lru_; // front = most recent
  std::unordered_map<std::string, Entry>                 entries_;
  std::unordered_map<std::string, std::set<std::string>> keys_by_id_;
  uint64_t                                               occupancy_bytes_ = 0;
};

} // namespace resource::compiled
