#include "local_compiled_backend.hpp"

#include <algorithm>
#include <vector>

#include "internal/compiled/compiled_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace resource::compiled {

using resource::pipeline::v1::CompiledRecord;
using resource::pipeline::v1::ResourceID;
using resource::pipeline::v1::ResourceKey;

LocalCompiledBackend::LocalCompiledBackend(storage::StorageBackendPtr store, std::shared_ptr<db::Repository> repository,
                                           source::SourceBackendPtr source, uint32_t compiler_version, EvictionPolicy policy)
    : store_(std::move(store)),
      repository_(std::move(repository)),
      source_(std::move(source)),
      compiler_version_(compiler_version),
      policy_(policy) {
  if (!store_ || !repository_ || !source_) throw util::InvalidState("local compiled backend requires store, repository and source");
  if (compiler_version_ == 0) throw util::InvalidState("compiler version must be positive");
}

void LocalCompiledBackend::Hydrate() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListCompiled(*tx);
  tx->Commit();

  // oldest first so the most recent ends up at the front
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.last_access_ms < b.last_access_ms; });

  std::lock_guard lock(mutex_);
  for (auto& row : rows) {
    Track(std::move(row));
  }
  PublishOccupancyLocked();

  RESOURCE_LOG_INFO("compiled cache hydrated", {observability::IntField("entries", static_cast<int64_t>(entries_.size())),
                                                observability::IntField("bytes", static_cast<int64_t>(occupancy_bytes_))});
}

void LocalCompiledBackend::Track(db::model::CompiledRow row) {
  const std::string key = row.key;
  if (entries_.contains(key)) DropLocked(key);

  lru_.push_front(key);
  occupancy_bytes_ += row.size_bytes;
  keys_by_id_[row.id].insert(key);
  entries_.emplace(key, Entry{std::move(row), lru_.begin()});
}

/*
  Forget an entry and delete its blob and row.
*/
void LocalCompiledBackend::DropLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return;

  const auto id = it->second.row.id;
  occupancy_bytes_ -= std::min(occupancy_bytes_, it->second.row.size_bytes);
  lru_.erase(it->second.lru);
  entries_.erase(it);

  auto by_id = keys_by_id_.find(id);
  if (by_id != keys_by_id_.end()) {
    by_id->second.erase(key);
    if (by_id->second.empty()) keys_by_id_.erase(by_id);
  }

  store_->Remove(key);
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteCompiled(*tx, key), "delete compiled " + key);
  tx->Commit();
}

void LocalCompiledBackend::PublishOccupancyLocked() const {
  observability::Metrics::Instance().SetCacheOccupancyBytes(occupancy_bytes_);
}

LookupResult LocalCompiledBackend::Get(const ResourceKey& requested) {
  const auto key = NormalizeKey(requested, compiler_version_);

  // Ask the source before taking mutex_: a local source may publish into
  // this backend while holding its own lock.
  uint64_t live_counter = 0;
  try {
    live_counter = source_->CurrentCounter(key.id());
  } catch (const util::NotFound&) {
    Invalidate(key.id());
    observability::Metrics::Instance().RecordCacheLookup("miss");
    return {LookupStatus::kNotFound, std::nullopt};
  }

  const auto blob_key = BlobKey(key);

  std::lock_guard lock(mutex_);
  auto            it = entries_.find(blob_key);
  if (it == entries_.end()) {
    // an older compiler version for the same platform is stale, not missing
    auto by_id = keys_by_id_.find(util::Describe(key.id()));
    if (by_id != keys_by_id_.end()) {
      for (const auto& other : by_id->second) {
        const auto& row = entries_.at(other).row;
        if (row.platform == key.platform() && row.compiler_version < key.compiler_version()) {
          observability::Metrics::Instance().RecordCacheLookup("stale");
          return {LookupStatus::kStale, std::nullopt};
        }
      }
    }
    observability::Metrics::Instance().RecordCacheLookup("miss");
    return {LookupStatus::kNotFound, std::nullopt};
  }

  auto& entry = it->second;
  if (entry.row.source_change_counter != live_counter || entry.row.compiler_version < compiler_version_) {
    observability::Metrics::Instance().RecordCacheLookup("stale");
    return {LookupStatus::kStale, std::nullopt};
  }

  CompiledArtifact artifact;
  if (!artifact.record.ParseFromString(entry.row.record)) {
    RESOURCE_LOG_WARN("dropping corrupt compiled index row", {observability::StringField("key", blob_key)});
    DropLocked(blob_key);
    observability::Metrics::Instance().RecordCacheLookup("miss");
    return {LookupStatus::kNotFound, std::nullopt};
  }

  try {
    artifact.payload = store_->Read(blob_key);
  } catch (const util::NotFound&) {
    RESOURCE_LOG_WARN("dropping compiled entry without blob", {observability::StringField("key", blob_key)});
    DropLocked(blob_key);
    PublishOccupancyLocked();
    observability::Metrics::Instance().RecordCacheLookup("miss");
    return {LookupStatus::kNotFound, std::nullopt};
  }

  lru_.splice(lru_.begin(), lru_, entry.lru);
  entry.row.last_access_ms = util::NowMillis();
  {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->TouchCompiled(*tx, blob_key, entry.row.last_access_ms), "touch compiled " + blob_key);
    tx->Commit();
  }

  observability::Metrics::Instance().RecordCacheLookup("hit");
  return {LookupStatus::kOk, std::move(artifact)};
}

void LocalCompiledBackend::Put(const CompiledArtifact& artifact) {
  const auto key = NormalizeKey(artifact.record.key(), compiler_version_);
  ValidateSections(artifact);

  CompiledRecord record = artifact.record;
  *record.mutable_key() = key;
  record.set_compiler_version(key.compiler_version());
  record.set_size_bytes(artifact.payload ? static_cast<uint64_t>(artifact.payload->size()) : 0);

  db::model::CompiledRow row;
  row.key                   = BlobKey(key);
  row.id                    = util::Describe(key.id());
  row.platform              = key.platform();
  row.compiler_version      = key.compiler_version();
  row.source_change_counter = record.source_change_counter();
  row.size_bytes            = record.size_bytes();
  row.record                = record.SerializeAsString();
  row.last_access_ms        = util::NowMillis();

  std::lock_guard lock(mutex_);

  store_->Write(row.key, artifact.payload ? artifact.payload : std::make_shared<arrow::Buffer>(nullptr, 0), /*fsync=*/false);
  {
    auto tx = repository_->Begin();
    db::ThrowIfError(repository_->UpsertCompiled(*tx, row), "upsert compiled " + row.key);
    tx->Commit();
  }

  // older compiler versions of the same (id, platform) are superseded
  std::vector<std::string> superseded;
  auto                     by_id = keys_by_id_.find(row.id);
  if (by_id != keys_by_id_.end()) {
    for (const auto& other : by_id->second) {
      const auto& other_row = entries_.at(other).row;
      if (other != row.key && other_row.platform == row.platform && other_row.compiler_version < row.compiler_version) {
        superseded.push_back(other);
      }
    }
  }
  for (const auto& other : superseded) {
    DropLocked(other);
  }

  // Track() would DropLocked() the old entry and delete the new blob
  if (auto existing = entries_.find(row.key); existing != entries_.end()) {
    occupancy_bytes_ -= std::min(occupancy_bytes_, existing->second.row.size_bytes);
    occupancy_bytes_ += row.size_bytes;
    existing->second.row = std::move(row);
    lru_.splice(lru_.begin(), lru_, existing->second.lru);
  } else {
    Track(std::move(row));
  }

  if (policy_.capacity_bytes > 0 && occupancy_bytes_ > policy_.capacity_bytes) {
    const auto evicted = EvictLocked(policy_, BlobKey(key));
    RESOURCE_LOG_DEBUG("compiled cache over capacity", {observability::IntField("evicted", static_cast<int64_t>(evicted))});
  }
  PublishOccupancyLocked();
}

uint64_t LocalCompiledBackend::Evict(const EvictionPolicy& policy) {
  std::lock_guard lock(mutex_);
  const auto      evicted = EvictLocked(policy, std::nullopt);
  PublishOccupancyLocked();
  return evicted;
}

uint64_t LocalCompiledBackend::EvictLocked(const EvictionPolicy& policy, const std::optional<std::string>& protect) {
  uint64_t evicted = 0;

  if (policy.max_age.count() > 0) {
    const uint64_t now    = util::NowMillis();
    const uint64_t max_ms = static_cast<uint64_t>(policy.max_age.count());

    std::vector<std::string> expired;
    for (const auto& [key, entry] : entries_) {
      if (protect && key == *protect) continue;
      if (now > entry.row.last_access_ms && now - entry.row.last_access_ms > max_ms) expired.push_back(key);
    }
    for (const auto& key : expired) {
      DropLocked(key);
      ++evicted;
    }
  }

  if (policy.capacity_bytes > 0) {
    auto it = lru_.end();
    while (occupancy_bytes_ > policy.capacity_bytes && it != lru_.begin()) {
      --it;
      if (protect && *it == *protect) continue;

      const std::string victim = *it;
      it                       = std::next(it); // DropLocked invalidates the victim's iterator
      DropLocked(victim);
      ++evicted;
    }
  }

  if (evicted > 0) observability::Metrics::Instance().RecordEvictions(evicted);
  return evicted;
}

void LocalCompiledBackend::Invalidate(const ResourceID& id) {
  std::lock_guard lock(mutex_);

  auto by_id = keys_by_id_.find(util::Describe(id));
  if (by_id == keys_by_id_.end()) return;

  const std::vector<std::string> keys(by_id->second.begin(), by_id->second.end());
  for (const auto& key : keys) {
    DropLocked(key);
  }
  PublishOccupancyLocked();

  RESOURCE_LOG_DEBUG("compiled entries invalidated",
                     {observability::StringField("id", util::Describe(id)), observability::IntField("entries", static_cast<int64_t>(keys.size()))});
}

uint64_t LocalCompiledBackend::OccupancyBytes() const {
  std::lock_guard lock(mutex_);
  return occupancy_bytes_;
}

size_t LocalCompiledBackend::EntryCount() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace resource::compiled
