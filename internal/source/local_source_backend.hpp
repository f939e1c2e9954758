#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/source/change_tracker.hpp"
#include "internal/source/source_backend.hpp"
#include "internal/storage/storage_backend.hpp"

namespace resource::source {

/*
  Source backend on local storage.

    payload bytes   -> blob store, key = dashed UUID
    record + state  -> metadata repository
    change events   -> event bus, published under the id's shard lock
                       so per-id order matches counter order
*/
class LocalSourceBackend final : public SourceBackend {
 public:
  LocalSourceBackend(storage::StorageBackendPtr store, std::shared_ptr<db::Repository> repository, event::EventBusPtr bus);

  // Rebuilds tracker state from the repository.
  void Hydrate();

  SourceResource Fetch(const resource::pipeline::v1::ResourceID& id) override;

  uint64_t Store(const resource::pipeline::v1::ResourceID& id, const Properties& properties, stream::Stream& payload) override;

  uint64_t Remove(const resource::pipeline::v1::ResourceID& id) override;

  uint64_t CurrentCounter(const resource::pipeline::v1::ResourceID& id) override;

  event::EventChannelPtr Subscribe(const resource::pipeline::v1::EventFilter& filter) override;

  const event::EventBusPtr& Bus() const {
    return bus_;
  }

 private:
  void Persist(const db::model::SourceRow& row);

  storage::StorageBackendPtr      store_;
  std::shared_ptr<db::Repository> repository_;
  event::EventBusPtr              bus_;
  ChangeTracker                   tracker_;
};

} // namespace resource::source
