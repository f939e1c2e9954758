#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "resource/pipeline/v1.hpp"

namespace resource::source {

struct TrackedState {
  std::string content_hash;
  uint64_t    change_counter = 0;
  uint64_t    sequence       = 0;
  std::string resource_namespace;
  bool        removed = false;
};

struct ChangeDecision {
  // false: content identical, nothing to persist or publish
  bool                                changed = false;
  resource::pipeline::v1::ChangeEvent event;
};

/*
  Per-resource change counters.

    first store          -> counter 0, Added
    different content    -> counter + 1, Modified
    identical content    -> no change
    remove               -> counter + 1, Removed
    store after remove   -> counter + 1, Added

  Every event also takes the next sequence number of its id.

  State is sharded by id. Evaluate/Apply/Get must be called with the
  shard lock from Lock(id) held, so a decision and its application are
  atomic with respect to other writers of the same id.
*/
class ChangeTracker {
 public:
  static constexpr size_t kShardCount = 64;

  std::unique_lock<std::mutex> Lock(const resource::pipeline::v1::ResourceID& id);

  ChangeDecision EvaluateStore(const resource::pipeline::v1::ResourceID& id, const std::string& content_hash,
                               const std::string& resource_namespace) const;

  // Throws util::NotFound for unknown or removed ids.
  ChangeDecision EvaluateRemove(const resource::pipeline::v1::ResourceID& id) const;

  void Apply(const ChangeDecision& decision, const std::string& content_hash);

  std::optional<TrackedState> Get(const resource::pipeline::v1::ResourceID& id) const;

  // Startup hydration. Takes the shard lock itself.
  void Restore(const resource::pipeline::v1::ResourceID& id, TrackedState state);

  // Takes the shard lock itself. Throws util::NotFound for unknown or removed ids.
  uint64_t CurrentCounter(const resource::pipeline::v1::ResourceID& id);

 private:
  struct Shard {
    std::mutex                                    mutex;
    std::unordered_map<std::string, TrackedState> states;
  };

  Shard&       ShardFor(const std::string& key);
  const Shard& ShardFor(const std::string& key) const;

  std::array<Shard, kShardCount> shards_;
};

} // namespace resource::source
