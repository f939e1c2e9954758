#include "internal/compiled/local_compiled_backend.hpp"

#include <cassert>
#include <iostream>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/source/local_source_backend.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::compiled::CompiledArtifact;
using resource::compiled::EvictionPolicy;
using resource::compiled::LocalCompiledBackend;
using resource::compiled::LookupStatus;

constexpr uint64_t kPlatform = 0x3;

struct Fixture {
  std::shared_ptr<resource::source::LocalSourceBackend> source = std::make_shared<resource::source::LocalSourceBackend>(
      resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {}),
      std::make_shared<resource::db::memory::MemoryRepository>(), std::make_shared<resource::event::EventBus>(16));

  resource::storage::StorageBackendPtr                    store = resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {});
  std::shared_ptr<resource::db::memory::MemoryRepository> index = std::make_shared<resource::db::memory::MemoryRepository>();

  std::unique_ptr<LocalCompiledBackend> Make(uint32_t compiler_version, EvictionPolicy policy = {}) {
    return std::make_unique<LocalCompiledBackend>(store, index, source, compiler_version, policy);
  }

  ResourceID AddSource(const std::string& bytes) {
    auto id = resource::util::NewResourceID();
    Update(id, bytes);
    return id;
  }

  uint64_t Update(const ResourceID& id, const std::string& bytes) {
    auto payload = resource::stream::BufferStream::FromString(bytes);
    return source->Store(id, {{"type", "blob"}}, *payload);
  }
};

ResourceKey Key(const ResourceID& id, uint32_t compiler_version = 0) {
  ResourceKey key;
  *key.mutable_id() = id;
  key.set_platform(kPlatform);
  key.set_compiler_version(compiler_version);
  return key;
}

CompiledArtifact Artifact(const ResourceID& id, uint64_t counter, const std::string& bytes, uint32_t compiler_version = 0) {
  CompiledArtifact artifact;
  *artifact.record.mutable_key() = Key(id, compiler_version);
  artifact.record.set_source_change_counter(counter);
  auto* section = artifact.record.add_sections();
  section->set_name("body");
  section->set_offset(0);
  section->set_length(bytes.size());
  artifact.payload = arrow::Buffer::FromString(bytes);
  return artifact;
}

void TestPutThenGet() {
  Fixture f;
  auto    cache = f.Make(1);
  auto    id    = f.AddSource("src");

  assert(cache->Get(Key(id)).status == LookupStatus::kNotFound);

  cache->Put(Artifact(id, 0, "compiled"));
  auto hit = cache->Get(Key(id));
  assert(hit.status == LookupStatus::kOk);
  assert(hit.artifact->record.compiler_version() == 1);
  assert(hit.artifact->record.size_bytes() == 8);
  assert(hit.artifact->Section("body")->ToString() == "compiled");
  assert(cache->OccupancyBytes() == 8);
}

void TestSourceChangeMakesEntryStale() {
  Fixture f;
  auto    cache = f.Make(1);
  auto    id    = f.AddSource("v0");

  cache->Put(Artifact(id, 0, "c0"));
  assert(f.Update(id, "v0") == 0);
  assert(cache->Get(Key(id)).status == LookupStatus::kOk);

  assert(f.Update(id, "v1") == 1);
  auto stale = cache->Get(Key(id));
  assert(stale.status == LookupStatus::kStale);
  assert(!stale.artifact);

  cache->Put(Artifact(id, 1, "c1"));
  assert(cache->Get(Key(id)).status == LookupStatus::kOk);
  assert(cache->EntryCount() == 1);
}

void TestRemovedSourceIsNotFound() {
  Fixture f;
  auto    cache = f.Make(1);
  auto    id    = f.AddSource("v0");

  cache->Put(Artifact(id, 0, "c0"));
  f.source->Remove(id);
  assert(cache->Get(Key(id)).status == LookupStatus::kNotFound);
  assert(cache->EntryCount() == 0);
}

void TestLeastRecentlyUsedIsEvicted() {
  Fixture        f;
  EvictionPolicy policy;
  policy.capacity_bytes = 10;
  auto cache            = f.Make(1, policy);

  auto a = f.AddSource("a");
  auto b = f.AddSource("b");
  auto c = f.AddSource("c");

  cache->Put(Artifact(a, 0, "aaaa"));
  cache->Put(Artifact(b, 0, "bbbb"));
  assert(cache->Get(Key(a)).status == LookupStatus::kOk);

  cache->Put(Artifact(c, 0, "cccc"));
  assert(cache->OccupancyBytes() == 8);
  assert(cache->Get(Key(b)).status == LookupStatus::kNotFound);
  assert(cache->Get(Key(a)).status == LookupStatus::kOk);
  assert(cache->Get(Key(c)).status == LookupStatus::kOk);
}

void TestOversizedEntryIsKept() {
  Fixture        f;
  EvictionPolicy policy;
  policy.capacity_bytes = 4;
  auto cache            = f.Make(1, policy);

  auto small = f.AddSource("s");
  auto large = f.AddSource("l");
  cache->Put(Artifact(small, 0, "ss"));
  cache->Put(Artifact(large, 0, "llllllll"));

  assert(cache->Get(Key(large)).status == LookupStatus::kOk);
  assert(cache->Get(Key(small)).status == LookupStatus::kNotFound);
}

void TestExplicitEvictByAge() {
  Fixture f;
  auto    cache = f.Make(1);
  auto    id    = f.AddSource("x");
  cache->Put(Artifact(id, 0, "xx"));

  EvictionPolicy policy;
  policy.max_age = std::chrono::milliseconds(1);
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  assert(cache->Evict(policy) == 1);
  assert(cache->EntryCount() == 0);
  assert(cache->OccupancyBytes() == 0);
}

void TestNewCompilerVersionSupersedes() {
  Fixture f;
  auto    id = f.AddSource("src");
  {
    auto v1 = f.Make(1);
    v1->Put(Artifact(id, 0, "old"));
  }

  auto v2 = f.Make(2);
  v2->Hydrate();
  assert(v2->EntryCount() == 1);

  // an older compiler version is stale, even when asked for by number
  assert(v2->Get(Key(id)).status == LookupStatus::kStale);
  assert(v2->Get(Key(id, 1)).status == LookupStatus::kStale);

  v2->Put(Artifact(id, 0, "new"));
  assert(v2->EntryCount() == 1);
  auto hit = v2->Get(Key(id));
  assert(hit.status == LookupStatus::kOk);
  assert(hit.artifact->payload->ToString() == "new");
}

void TestInvalidateDropsEveryPlatform() {
  Fixture f;
  auto    cache = f.Make(1);
  auto    id    = f.AddSource("src");

  auto other = Artifact(id, 0, "other");
  other.record.mutable_key()->set_platform(kPlatform | 0x10);
  cache->Put(Artifact(id, 0, "main"));
  cache->Put(other);
  assert(cache->EntryCount() == 2);

  cache->Invalidate(id);
  assert(cache->EntryCount() == 0);
  assert(cache->Get(Key(id)).status == LookupStatus::kNotFound);
}

void TestSectionOutsidePayloadRejected() {
  Fixture f;
  auto    cache    = f.Make(1);
  auto    id       = f.AddSource("src");
  auto    artifact = Artifact(id, 0, "abc");
  artifact.record.mutable_sections(0)->set_length(10);

  bool threw = false;
  try {
    cache->Put(artifact);
  } catch (const resource::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(cache->EntryCount() == 0);
}

} // namespace

int main() {
  TestPutThenGet();
  TestSourceChangeMakesEntryStale();
  TestRemovedSourceIsNotFound();
  TestLeastRecentlyUsedIsEvicted();
  TestOversizedEntryIsKept();
  TestExplicitEvictByAge();
  TestNewCompilerVersionSupersedes();
  TestInvalidateDropsEveryPlatform();
  TestSectionOutsidePayloadRejected();

  std::cout << "resource_unit_local_compiled_backend: pass\n";
  return 0;
}
