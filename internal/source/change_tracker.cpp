#include "change_tracker.hpp"

#include <functional>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::source {

using resource::pipeline::v1::ChangeEvent;
using resource::pipeline::v1::ResourceID;

ChangeTracker::Shard& ChangeTracker::ShardFor(const std::string& key) {
  return shards_[std::hash<std::string>{}(key) % kShardCount];
}

const ChangeTracker::Shard& ChangeTracker::ShardFor(const std::string& key) const {
  return shards_[std::hash<std::string>{}(key) % kShardCount];
}

std::unique_lock<std::mutex> ChangeTracker::Lock(const ResourceID& id) {
  return std::unique_lock<std::mutex>(ShardFor(id.value()).mutex);
}

ChangeDecision ChangeTracker::EvaluateStore(const ResourceID& id, const std::string& content_hash, const std::string& resource_namespace) const {
  const auto& states = ShardFor(id.value()).states;
  auto        it     = states.find(id.value());

  ChangeDecision decision;
  ChangeEvent&   event = decision.event;
  *event.mutable_id()  = id;
  event.set_resource_namespace(resource_namespace);

  if (it == states.end()) {
    decision.changed = true;
    event.set_kind(resource::pipeline::v1::CHANGE_KIND_ADDED);
    event.set_change_counter(0);
    event.set_sequence(1);
    return decision;
  }

  const TrackedState& state = it->second;
  if (!state.removed && state.content_hash == content_hash) {
    event.set_change_counter(state.change_counter);
    event.set_sequence(state.sequence);
    return decision;
  }

  decision.changed = true;
  event.set_kind(state.removed ? resource::pipeline::v1::CHANGE_KIND_ADDED : resource::pipeline::v1::CHANGE_KIND_MODIFIED);
  event.set_change_counter(state.change_counter + 1);
  event.set_sequence(state.sequence + 1);
  return decision;
}

ChangeDecision ChangeTracker::EvaluateRemove(const ResourceID& id) const {
  const auto& states = ShardFor(id.value()).states;
  auto        it     = states.find(id.value());
  if (it == states.end() || it->second.removed) throw util::NotFound("source resource not found: " + util::Describe(id));

  ChangeDecision decision;
  decision.changed     = true;
  ChangeEvent& event   = decision.event;
  *event.mutable_id()  = id;
  event.set_resource_namespace(it->second.resource_namespace);
  event.set_kind(resource::pipeline::v1::CHANGE_KIND_REMOVED);
  event.set_change_counter(it->second.change_counter + 1);
  event.set_sequence(it->second.sequence + 1);
  return decision;
}

void ChangeTracker::Apply(const ChangeDecision& decision, const std::string& content_hash) {
  if (!decision.changed) return;

  const auto& event = decision.event;
  auto&       state = ShardFor(event.id().value()).states[event.id().value()];

  state.change_counter     = event.change_counter();
  state.sequence           = event.sequence();
  state.resource_namespace = event.resource_namespace();
  state.removed            = event.kind() == resource::pipeline::v1::CHANGE_KIND_REMOVED;
  state.content_hash       = state.removed ? std::string{} : content_hash;
}

std::optional<TrackedState> ChangeTracker::Get(const ResourceID& id) const {
  const auto& states = ShardFor(id.value()).states;
  auto        it     = states.find(id.value());
  if (it == states.end()) return std::nullopt;
  return it->second;
}

void ChangeTracker::Restore(const ResourceID& id, TrackedState state) {
  auto&           shard = ShardFor(id.value());
  std::lock_guard lock(shard.mutex);
  shard.states[id.value()] = std::move(state);
}

uint64_t ChangeTracker::CurrentCounter(const ResourceID& id) {
  auto&           shard = ShardFor(id.value());
  std::lock_guard lock(shard.mutex);

  auto it = shard.states.find(id.value());
  if (it == shard.states.end() || it->second.removed) throw util::NotFound("source resource not found: " + util::Describe(id));
  return it->second.change_counter;
}

} // namespace resource::source
