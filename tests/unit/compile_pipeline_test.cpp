#include "internal/compile/compile_pipeline.hpp"

#include <atomic>
#include <cassert>
#include <cctype>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/compiled/local_compiled_backend.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/source/local_source_backend.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::compile::CompileInput;
using resource::compile::CompileOutput;
using resource::compile::CompilePipeline;
using resource::compile::CompilerRegistry;

class UnreachableSource final : public resource::source::SourceBackend {
 public:
  resource::source::SourceResource Fetch(const ResourceID&) override {
    throw resource::util::Unavailable("connection refused");
  }
  uint64_t Store(const ResourceID&, const resource::source::Properties&, resource::stream::Stream&) override {
    throw resource::util::Unavailable("connection refused");
  }
  uint64_t Remove(const ResourceID&) override {
    throw resource::util::Unavailable("connection refused");
  }
  uint64_t CurrentCounter(const ResourceID&) override {
    throw resource::util::Unavailable("connection refused");
  }
  resource::event::EventChannelPtr Subscribe(const EventFilter&) override {
    throw resource::util::Unavailable("connection refused");
  }
};

struct Fixture {
  std::shared_ptr<resource::source::LocalSourceBackend> source = std::make_shared<resource::source::LocalSourceBackend>(
      resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {}),
      std::make_shared<resource::db::memory::MemoryRepository>(), std::make_shared<resource::event::EventBus>(16));

  std::shared_ptr<resource::compiled::LocalCompiledBackend> cache = std::make_shared<resource::compiled::LocalCompiledBackend>(
      resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {}),
      std::make_shared<resource::db::memory::MemoryRepository>(), source, 1, resource::compiled::EvictionPolicy{});

  std::shared_ptr<CompilerRegistry> registry = std::make_shared<CompilerRegistry>();

  CompilePipeline pipeline{source, cache, registry, 1};

  ResourceID Add(const std::string& type, const std::string& bytes) {
    auto id = resource::util::NewResourceID();
    Update(id, type, bytes);
    return id;
  }

  uint64_t Update(const ResourceID& id, const std::string& type, const std::string& bytes) {
    auto payload = resource::stream::BufferStream::FromString(bytes);
    return source->Store(id, {{"type", type}}, *payload);
  }
};

ResourceKey Key(const ResourceID& id, uint64_t platform = 0) {
  ResourceKey key;
  *key.mutable_id() = id;
  key.set_platform(platform);
  return key;
}

CompileOutput Upper(const CompileInput& input) {
  auto text = input.payload->ToString();
  for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  CompileOutput output;
  output.payload = arrow::Buffer::FromString(text);
  Section section;
  section.set_name("static");
  section.set_length(text.size());
  output.sections.push_back(section);
  return output;
}

void TestCompileCachesResult() {
  Fixture f;
  std::atomic<int> runs{0};
  f.registry->Register("text", 0, [&](const CompileInput& input) {
    ++runs;
    return Upper(input);
  });

  auto id       = f.Add("text", "hello");
  auto artifact = f.pipeline.Compile(Key(id));
  assert(artifact.payload->ToString() == "HELLO");
  assert(artifact.record.source_change_counter() == 0);
  assert(artifact.record.compiler_version() == 1);
  assert(artifact.Section("static")->ToString() == "HELLO");

  assert(f.pipeline.Compile(Key(id)).payload->ToString() == "HELLO");
  assert(runs == 1);

  // identical re-store keeps the cached artifact
  f.Update(id, "text", "hello");
  f.pipeline.Compile(Key(id));
  assert(runs == 1);

  f.Update(id, "text", "world");
  auto recompiled = f.pipeline.Compile(Key(id));
  assert(runs == 2);
  assert(recompiled.payload->ToString() == "WORLD");
  assert(recompiled.record.source_change_counter() == 1);
}

void TestConcurrentCallersShareOneRun() {
  Fixture          f;
  std::atomic<int> runs{0};
  f.registry->Register("slow", 0, [&](const CompileInput& input) {
    ++runs;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return Upper(input);
  });
  auto id = f.Add("slow", "abc");

  std::vector<std::thread> threads;
  std::atomic<int>         ok{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (f.pipeline.Compile(Key(id)).payload->ToString() == "ABC") ++ok;
    });
  }
  for (auto& thread : threads) thread.join();

  // late arrivals are served from the cache
  assert(runs == 1);
  assert(ok == 8);
  assert(f.pipeline.InFlight() == 0);
}

void TestFailureIsNotCached() {
  Fixture          f;
  std::atomic<int> runs{0};
  f.registry->Register("flaky", 0, [&](const CompileInput& input) {
    if (runs++ == 0) throw resource::util::CompileFailure("bad input");
    return Upper(input);
  });
  auto id = f.Add("flaky", "x");

  bool threw = false;
  try {
    (void)f.pipeline.Compile(Key(id));
  } catch (const resource::util::CompileFailure&) {
    threw = true;
  }
  assert(threw);
  assert(f.pipeline.InFlight() == 0);
  assert(f.cache->Get(Key(id)).status == resource::compiled::LookupStatus::kNotFound);

  assert(f.pipeline.Compile(Key(id)).payload->ToString() == "X");
  assert(runs == 2);
}

void TestMostSpecificPlatformWins() {
  Fixture f;
  f.registry->Register("text", 0, Upper);
  f.registry->Register("text", 0x1, [](const CompileInput& input) {
    CompileOutput output;
    output.payload = arrow::Buffer::FromString("p1:" + input.payload->ToString());
    return output;
  });
  auto id = f.Add("text", "v");

  assert(f.pipeline.Compile(Key(id, 0x1)).payload->ToString() == "p1:v");
  assert(f.pipeline.Compile(Key(id, 0x2)).payload->ToString() == "V");
  assert(f.cache->EntryCount() == 2);
}

void TestUnknownTypeFails() {
  Fixture f;
  auto    id = f.Add("nothing-registered", "x");

  bool threw = false;
  try {
    (void)f.pipeline.Compile(Key(id));
  } catch (const resource::util::CompileFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingSourceIsNotFound() {
  Fixture f;
  f.registry->Register("text", 0, Upper);

  bool threw = false;
  try {
    (void)f.pipeline.Compile(Key(resource::util::NewResourceID()));
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUnreachableSourceIsSourceUnavailable() {
  auto source   = std::make_shared<UnreachableSource>();
  auto cache    = std::make_shared<resource::compiled::LocalCompiledBackend>(resource::storage::StorageFactory::Build(resource::storage::Tier::kRam, {}),
                                                                          std::make_shared<resource::db::memory::MemoryRepository>(), source, 1,
                                                                          resource::compiled::EvictionPolicy{});
  auto registry = std::make_shared<CompilerRegistry>();
  resource::compile::RegisterBuiltinCompilers(*registry);
  CompilePipeline pipeline(source, cache, registry, 1);

  bool threw = false;
  try {
    (void)pipeline.Compile(Key(resource::util::NewResourceID()));
  } catch (const resource::util::SourceUnavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestBuiltinPropertiesCompiler() {
  Fixture f;
  resource::compile::RegisterBuiltinCompilers(*f.registry);

  auto id      = resource::util::NewResourceID();
  auto payload = resource::stream::BufferStream::FromString("body");
  f.source->Store(id, {{"type", "properties"}, {"color", "red"}}, *payload);

  auto artifact = f.pipeline.Compile(Key(id));
  assert(artifact.Section("static")->ToString() == "body");
  assert(artifact.Section("dynamic")->ToString().find("\"color\"") != std::string::npos);
}

} // namespace

int main() {
  TestCompileCachesResult();
  TestConcurrentCallersShareOneRun();
  TestFailureIsNotCached();
  TestMostSpecificPlatformWins();
  TestUnknownTypeFails();
  TestMissingSourceIsNotFound();
  TestUnreachableSourceIsSourceUnavailable();
  TestBuiltinPropertiesCompiler();

  std::cout << "resource_unit_compile_pipeline: pass\n";
  return 0;
}
