#include "local_source_backend.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/uuid.hpp"

#include <exception>

namespace resource::source {

using resource::pipeline::v1::ResourceID;

namespace {

std::string BlobKey(const ResourceID& id) {
  return util::Describe(id);
}

void ValidateId(const ResourceID& id) {
  if (id.value().size() != 16) throw util::InvalidState("resource id must be 16 bytes");
}

} // namespace

LocalSourceBackend::LocalSourceBackend(storage::StorageBackendPtr store, std::shared_ptr<db::Repository> repository, event::EventBusPtr bus)
    : store_(std::move(store)), repository_(std::move(repository)), bus_(std::move(bus)) {
  if (!store_ || !repository_ || !bus_) throw util::InvalidState("local source backend requires store, repository and bus");
}

void LocalSourceBackend::Hydrate() {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListSources(*tx);
  tx->Commit();

  for (const auto& row : rows) {
    TrackedState state;
    state.content_hash       = row.content_hash;
    state.change_counter     = row.change_counter;
    state.sequence           = row.sequence;
    state.resource_namespace = row.resource_namespace;
    state.removed            = row.removed;
    tracker_.Restore(util::ParseResourceID(row.id), std::move(state));
  }

  RESOURCE_LOG_INFO("source backend hydrated", {observability::IntField("resources", static_cast<int64_t>(rows.size()))});
}

void LocalSourceBackend::Persist(const db::model::SourceRow& row) {
  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->UpsertSource(*tx, row), "upsert source " + row.id);
  tx->Commit();
}

SourceResource LocalSourceBackend::Fetch(const ResourceID& id) {
  ValidateId(id);

  // shard lock keeps record and payload from two different versions
  auto lock  = tracker_.Lock(id);
  auto state = tracker_.Get(id);
  if (!state || state->removed) throw util::NotFound("source resource not found: " + util::Describe(id));

  std::optional<db::model::SourceRow> row;
  {
    auto tx = repository_->Begin();
    row     = repository_->GetSource(*tx, util::Describe(id));
    tx->Commit();
  }
  if (!row) throw util::NotFound("source resource not found: " + util::Describe(id));

  auto payload = store_->Read(BlobKey(id));

  SourceResource resource;
  *resource.record.mutable_id() = id;
  CopyProperties(DeserializeProperties(row->properties_json), resource.record.mutable_properties());
  resource.record.set_content_hash(util::FromHex(row->content_hash));
  resource.record.set_change_counter(row->change_counter);
  resource.record.set_size_bytes(static_cast<uint64_t>(payload->size()));
  resource.payload = std::make_unique<stream::BufferStream>(std::move(payload));
  return resource;
}

uint64_t LocalSourceBackend::Store(const ResourceID& id, const Properties& properties, stream::Stream& payload) {
  ValidateId(id);

  auto       bytes     = payload.ReadAll();
  const auto hash      = util::ToHex(util::ContentHash(properties, *bytes));
  const auto resource_namespace = NamespaceOf(properties);

  auto lock     = tracker_.Lock(id);
  auto decision = tracker_.EvaluateStore(id, hash, resource_namespace);
  if (!decision.changed) {
    RESOURCE_LOG_DEBUG("source store unchanged", {observability::StringField("id", util::Describe(id)),
                                                  observability::IntField("counter", static_cast<int64_t>(decision.event.change_counter()))});
    return decision.event.change_counter();
  }

  const auto key = BlobKey(id);
  std::shared_ptr<arrow::Buffer> previous;
  if (store_->Contains(key)) previous = store_->Read(key);

  store_->Write(key, bytes, /*fsync=*/true);

  db::model::SourceRow row;
  row.id                 = util::Describe(id);
  row.properties_json    = SerializeProperties(properties);
  row.content_hash       = hash;
  row.change_counter     = decision.event.change_counter();
  row.sequence           = decision.event.sequence();
  row.size_bytes         = static_cast<uint64_t>(bytes->size());
  row.resource_namespace = resource_namespace;
  row.removed            = false;
  try {
    Persist(row);
  } catch (const std::exception& e) {
    // payload must match the last committed row
    RESOURCE_LOG_WARN("source store rolled back", {observability::StringField("id", row.id), observability::StringField("error", e.what())});
    if (previous)
      store_->Write(key, previous, /*fsync=*/true);
    else
      store_->Remove(key);
    throw;
  }

  tracker_.Apply(decision, hash);
  lock.unlock();

  // callbacks run on this thread and may call back into the backend
  bus_->Publish(decision.event);

  RESOURCE_LOG_DEBUG("source stored", {observability::StringField("id", row.id), observability::IntField("counter", static_cast<int64_t>(row.change_counter)),
                                       observability::IntField("size_bytes", static_cast<int64_t>(row.size_bytes))});
  return row.change_counter;
}

uint64_t LocalSourceBackend::Remove(const ResourceID& id) {
  ValidateId(id);

  auto lock     = tracker_.Lock(id);
  auto decision = tracker_.EvaluateRemove(id);

  db::model::SourceRow row;
  row.id                 = util::Describe(id);
  row.properties_json    = SerializeProperties({});
  row.change_counter     = decision.event.change_counter();
  row.sequence           = decision.event.sequence();
  row.resource_namespace = decision.event.resource_namespace();
  row.removed            = true;
  Persist(row);

  store_->Remove(BlobKey(id));

  tracker_.Apply(decision, {});
  lock.unlock();

  bus_->Publish(decision.event);

  RESOURCE_LOG_DEBUG("source removed", {observability::StringField("id", row.id), observability::IntField("counter", static_cast<int64_t>(row.change_counter))});
  return row.change_counter;
}

uint64_t LocalSourceBackend::CurrentCounter(const ResourceID& id) {
  ValidateId(id);
  return tracker_.CurrentCounter(id);
}

event::EventChannelPtr LocalSourceBackend::Subscribe(const resource::pipeline::v1::EventFilter& filter) {
  return bus_->SubscribeQueued(filter);
}

} // namespace resource::source
