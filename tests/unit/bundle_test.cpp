#include "internal/bundle/bundle.hpp"

#include <cassert>
#include <iostream>

#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::bundle::Bundle;
using resource::bundle::BundleBuilder;
using resource::compiled::CompiledArtifact;

CompiledArtifact Artifact(const ResourceID& id, const std::string& bytes, uint64_t platform = 0) {
  CompiledArtifact artifact;
  *artifact.record.mutable_key()->mutable_id() = id;
  artifact.record.mutable_key()->set_platform(platform);
  artifact.record.mutable_key()->set_compiler_version(1);
  artifact.record.set_compiler_version(1);
  artifact.record.set_size_bytes(bytes.size());
  auto* section = artifact.record.add_sections();
  section->set_name("static");
  section->set_length(bytes.size());
  artifact.payload = arrow::Buffer::FromString(bytes);
  return artifact;
}

std::shared_ptr<arrow::Buffer> Encode(const Bundle& bundle) {
  resource::stream::BufferStream out;
  resource::bundle::WriteBundle(bundle, out);
  return out.Finish();
}

template <typename E>
bool DecodeThrows(std::string bytes) {
  auto in = resource::stream::BufferStream::FromString(std::move(bytes));
  try {
    (void)resource::bundle::ReadBundle(*in);
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestWriteReadPreservesOrderAndBytes() {
  auto a = resource::util::NewResourceID();
  auto b = resource::util::NewResourceID();
  auto c = resource::util::NewResourceID();

  Bundle bundle(std::vector<CompiledArtifact>{Artifact(a, "alpha", 0x1), Artifact(b, ""), Artifact(c, "gamma!")});

  resource::stream::BufferStream in(Encode(bundle));
  auto                           decoded = resource::bundle::ReadBundle(in);

  assert(decoded.Size() == 3);
  assert(decoded.Entries()[0].record.key().id().value() == a.value());
  assert(decoded.Entries()[0].record.key().platform() == 0x1);
  assert(decoded.Entries()[0].payload->ToString() == "alpha");
  assert(decoded.Entries()[1].payload->size() == 0);
  assert(decoded.Entries()[2].Section("static")->ToString() == "gamma!");
  assert(decoded.Find(b) != nullptr);
  assert(decoded.Find(resource::util::NewResourceID()) == nullptr);
}

void TestEmptyBundle() {
  resource::stream::BufferStream in(Encode(Bundle(std::vector<CompiledArtifact>{})));
  assert(resource::bundle::ReadBundle(in).Size() == 0);
}

void TestDuplicateResourceIsConflict() {
  auto id = resource::util::NewResourceID();

  bool threw = false;
  try {
    Bundle bundle(std::vector<CompiledArtifact>{Artifact(id, "a"), Artifact(id, "b", 0x2)});
  } catch (const resource::util::Conflict&) {
    threw = true;
  }
  assert(threw);

  // the builder rejects before asking the provider for anything
  int           calls = 0;
  BundleBuilder builder([&](const ResourceKey& key) {
    ++calls;
    return Artifact(key.id(), "x");
  });
  ResourceKey key;
  *key.mutable_id() = id;

  threw = false;
  try {
    (void)builder.Build({key, key});
  } catch (const resource::util::Conflict&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 0);
}

void TestBuilderUsesKeyOrder() {
  auto first  = resource::util::NewResourceID();
  auto second = resource::util::NewResourceID();

  BundleBuilder builder([](const ResourceKey& key) { return Artifact(key.id(), resource::util::Describe(key.id())); });

  std::vector<ResourceKey> keys(2);
  *keys[0].mutable_id() = second;
  *keys[1].mutable_id() = first;

  auto bundle = builder.Build(keys);
  assert(bundle.Entries()[0].record.key().id().value() == second.value());
  assert(bundle.Entries()[1].payload->ToString() == resource::util::Describe(first));
}

void TestProviderErrorPropagates() {
  BundleBuilder builder([](const ResourceKey&) -> CompiledArtifact { throw resource::util::NotFound("gone"); });
  ResourceKey   key;
  *key.mutable_id() = resource::util::NewResourceID();

  bool threw = false;
  try {
    (void)builder.Build({key});
  } catch (const resource::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedArchives() {
  const auto valid = Encode(Bundle(std::vector<CompiledArtifact>{Artifact(resource::util::NewResourceID(), "payload")}))->ToString();

  assert(DecodeThrows<resource::util::ProtocolError>(""));
  assert(DecodeThrows<resource::util::ProtocolError>("RSBNDL"));
  assert(DecodeThrows<resource::util::ProtocolError>("NOTABNDL" + std::string(4, '\0')));

  // truncated data section
  assert(DecodeThrows<resource::util::ProtocolError>(valid.substr(0, valid.size() - 3)));

  // index length beyond the input
  auto oversized = valid;
  oversized[8]   = 0x00;
  oversized[9]   = 0x7F;
  assert(DecodeThrows<resource::util::ProtocolError>(oversized));

  // garbage index
  std::string garbage = "RSBNDL01";
  garbage += std::string("\0\0\0\x04", 4);
  garbage += "\xFF\xFF\xFF\xFF";
  assert(DecodeThrows<resource::util::ProtocolError>(garbage));
}

} // namespace

int main() {
  TestWriteReadPreservesOrderAndBytes();
  TestEmptyBundle();
  TestDuplicateResourceIsConflict();
  TestBuilderUsesKeyOrder();
  TestProviderErrorPropagates();
  TestMalformedArchives();

  std::cout << "resource_unit_bundle: pass\n";
  return 0;
}
