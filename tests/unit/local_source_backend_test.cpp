#include "internal/source/local_source_backend.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::source::LocalSourceBackend;
using resource::source::Properties;

struct Fixture {
  std::shared_ptr<resource::db::memory::MemoryRepository> repository = std::make_shared<resource::db::memory::MemoryRepository>();
  resource::storage::StorageBackendPtr store = resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {});
  resource::event::EventBusPtr         bus   = std::make_shared<resource::event::EventBus>(16);

  std::unique_ptr<LocalSourceBackend> Make() {
    return std::make_unique<LocalSourceBackend>(store, repository, bus);
  }
};

uint64_t Store(LocalSourceBackend& backend, const ResourceID& id, const Properties& properties, const std::string& bytes) {
  auto payload = resource::stream::BufferStream::FromString(bytes);
  return backend.Store(id, properties, *payload);
}

// Delegates to a memory repository; source upserts fail while fail_upserts is set.
class FlakyRepository final : public resource::db::Repository {
 public:
  bool fail_upserts = false;

  std::unique_ptr<resource::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  resource::db::Result UpsertSource(resource::db::Transaction& tx, const resource::db::model::SourceRow& row) override {
    if (fail_upserts) return resource::db::Result::Err(resource::db::ErrorCode::IOError, "disk full");
    return inner_.UpsertSource(tx, row);
  }
  std::optional<resource::db::model::SourceRow> GetSource(resource::db::Transaction& tx, const std::string& id) override {
    return inner_.GetSource(tx, id);
  }
  std::vector<resource::db::model::SourceRow> ListSources(resource::db::Transaction& tx) override {
    return inner_.ListSources(tx);
  }
  resource::db::Result UpsertCompiled(resource::db::Transaction& tx, const resource::db::model::CompiledRow& row) override {
    return inner_.UpsertCompiled(tx, row);
  }
  std::optional<resource::db::model::CompiledRow> GetCompiled(resource::db::Transaction& tx, const std::string& key) override {
    return inner_.GetCompiled(tx, key);
  }
  std::vector<resource::db::model::CompiledRow> ListCompiled(resource::db::Transaction& tx) override {
    return inner_.ListCompiled(tx);
  }
  std::vector<resource::db::model::CompiledRow> ListCompiledFor(resource::db::Transaction& tx, const std::string& id) override {
    return inner_.ListCompiledFor(tx, id);
  }
  resource::db::Result TouchCompiled(resource::db::Transaction& tx, const std::string& key, uint64_t last_access_ms) override {
    return inner_.TouchCompiled(tx, key, last_access_ms);
  }
  resource::db::Result DeleteCompiled(resource::db::Transaction& tx, const std::string& key) override {
    return inner_.DeleteCompiled(tx, key);
  }

 private:
  resource::db::memory::MemoryRepository inner_;
};

Properties Texture() {
  return {{"type", "texture"}, {"namespace", "env"}};
}

void TestStoreFetchRoundTrip() {
  Fixture f;
  auto    backend = f.Make();
  auto    id      = resource::util::NewResourceID();

  assert(Store(*backend, id, Texture(), "pixels") == 0);

  auto fetched = backend->Fetch(id);
  assert(fetched.record.id().value() == id.value());
  assert(fetched.record.change_counter() == 0);
  assert(fetched.record.size_bytes() == 6);
  assert(fetched.record.properties().at("type") == "texture");
  assert(fetched.record.content_hash().size() == 32);
  assert(fetched.payload->ReadAll()->ToString() == "pixels");
}

void TestIdempotentStoreKeepsCounterAndEmitsNothing() {
  Fixture f;
  auto    backend = f.Make();
  auto    id      = resource::util::NewResourceID();

  auto channel = backend->Subscribe({});
  Store(*backend, id, Texture(), "pixels");
  assert(Store(*backend, id, Texture(), "pixels") == 0);

  auto added = channel->PopFor(std::chrono::milliseconds(100));
  assert(added && added->kind() == CHANGE_KIND_ADDED);
  assert(!channel->PopFor(std::chrono::milliseconds(50)));

  // a property change alone is new content
  auto props    = Texture();
  props["lod"]  = "2";
  assert(Store(*backend, id, props, "pixels") == 1);
  auto modified = channel->PopFor(std::chrono::milliseconds(100));
  assert(modified && modified->kind() == CHANGE_KIND_MODIFIED);
  assert(modified->change_counter() == 1);
  assert(modified->resource_namespace() == "env");
}

void TestRemoveLeavesTombstone() {
  Fixture f;
  auto    backend = f.Make();
  auto    id      = resource::util::NewResourceID();

  Store(*backend, id, Texture(), "pixels");
  assert(backend->Remove(id) == 1);

  bool threw = false;
  try {
    (void)backend->Fetch(id);
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)backend->Remove(id);
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // counters keep rising across a remove
  assert(Store(*backend, id, Texture(), "pixels") == 2);
  assert(backend->CurrentCounter(id) == 2);
}

void TestFilteredSubscription() {
  Fixture f;
  auto    backend = f.Make();
  auto    watched = resource::util::NewResourceID();
  auto    other   = resource::util::NewResourceID();

  EventFilter filter;
  *filter.mutable_id() = watched;
  auto channel         = backend->Subscribe(filter);

  Store(*backend, other, Texture(), "a");
  Store(*backend, watched, Texture(), "b");
  Store(*backend, watched, Texture(), "c");

  auto first  = channel->PopFor(std::chrono::milliseconds(100));
  auto second = channel->PopFor(std::chrono::milliseconds(100));
  assert(first && first->id().value() == watched.value() && first->change_counter() == 0);
  assert(second && second->change_counter() == 1);
  assert(second->sequence() > first->sequence());
  assert(!channel->PopFor(std::chrono::milliseconds(20)));
}

void TestHydrateRestoresCounters() {
  Fixture f;
  auto    id      = resource::util::NewResourceID();
  auto    removed = resource::util::NewResourceID();
  {
    auto backend = f.Make();
    Store(*backend, id, Texture(), "v0");
    Store(*backend, id, Texture(), "v1");
    Store(*backend, removed, Texture(), "gone");
    backend->Remove(removed);
  }

  auto restarted = f.Make();
  restarted->Hydrate();
  assert(restarted->CurrentCounter(id) == 1);
  assert(restarted->Fetch(id).payload->ReadAll()->ToString() == "v1");
  assert(Store(*restarted, id, Texture(), "v1") == 1);
  assert(Store(*restarted, id, Texture(), "v2") == 2);

  bool threw = false;
  try {
    (void)restarted->CurrentCounter(removed);
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(Store(*restarted, removed, Texture(), "back") == 2);
}

void TestMalformedIdRejected() {
  Fixture    f;
  auto       backend = f.Make();
  ResourceID bad;
  bad.set_value("short");

  bool threw = false;
  try {
    (void)backend->Fetch(bad);
  } catch (const resource::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestCallbackMayReenterBackend() {
  Fixture f;
  auto    backend = f.Make();
  auto    id      = resource::util::NewResourceID();

  std::vector<uint64_t>    seen_counters;
  std::vector<std::string> seen_payloads;
  size_t                   removals = 0;
  f.bus->Subscribe({}, [&](const ChangeEvent& event) {
    if (event.kind() == CHANGE_KIND_REMOVED) {
      ++removals;
      return;
    }
    seen_counters.push_back(backend->CurrentCounter(event.id()));
    seen_payloads.push_back(backend->Fetch(event.id()).payload->ReadAll()->ToString());
  });

  Store(*backend, id, Texture(), "v0");
  Store(*backend, id, Texture(), "v1");
  backend->Remove(id);

  assert((seen_counters == std::vector<uint64_t>{0, 1}));
  assert(removals == 1);
  assert((seen_payloads == std::vector<std::string>{"v0", "v1"}));
}

void TestFailedPersistKeepsPreviousPayload() {
  Fixture f;
  auto    repository = std::make_shared<FlakyRepository>();
  auto    backend    = std::make_unique<LocalSourceBackend>(f.store, repository, f.bus);
  auto    id         = resource::util::NewResourceID();
  auto    fresh      = resource::util::NewResourceID();

  assert(Store(*backend, id, Texture(), "a") == 0);
  auto channel = backend->Subscribe({});

  repository->fail_upserts = true;
  bool threw               = false;
  try {
    Store(*backend, id, Texture(), "b");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Store(*backend, fresh, Texture(), "new");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  repository->fail_upserts = false;

  // payload, counter and tracker all still describe "a"
  auto fetched = backend->Fetch(id);
  assert(fetched.record.change_counter() == 0);
  assert(fetched.payload->ReadAll()->ToString() == "a");
  assert(backend->CurrentCounter(id) == 0);
  assert(!f.store->Contains(resource::util::Describe(fresh)));
  assert(!channel->PopFor(std::chrono::milliseconds(20)));

  assert(Store(*backend, id, Texture(), "b") == 1);
  assert(backend->Fetch(id).payload->ReadAll()->ToString() == "b");
}

} // namespace

int main() {
  TestStoreFetchRoundTrip();
  TestIdempotentStoreKeepsCounterAndEmitsNothing();
  TestRemoveLeavesTombstone();
  TestFilteredSubscription();
  TestHydrateRestoresCounters();
  TestMalformedIdRejected();
  TestCallbackMayReenterBackend();
  TestFailedPersistKeepsPreviousPayload();

  std::cout << "resource_unit_local_source_backend: pass\n";
  return 0;
}
