#include <iostream>
#include <string>

#include "client/cpp/resource_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/identity/resource_registry.hpp"
#include "internal/util/uuid.hpp"
#include "resource/pipeline/v1.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: resource_round_trip_example <config.yaml>\n";
    return 1;
  }

  auto config = resource::config::ConfigLoader::LoadFromYaml(argv[1]);
  resource::identity::ResourceRegistry::Instance().Initialize(config);

  resource::client::ResourceClient client(config);

  // Store a small source resource; the returned counter is its version.
  const auto id      = resource::util::NewResourceID();
  auto       counter = client.Store(id, {{"type", "properties"}, {"namespace", "examples"}, {"lod", "0"}}, arrow::Buffer::FromString("hello"));
  if (!counter.ok()) {
    std::cerr << "Store failed: " << counter.status().ToString() << '\n';
    return 1;
  }
  std::cout << "stored " << resource::util::Describe(id) << " at counter " << *counter << '\n';

  resource::pipeline::v1::ResourceKey key;
  *key.mutable_id() = id;

  auto artifact = client.Compile(key);
  if (!artifact.ok()) {
    std::cerr << "Compile failed: " << artifact.status().ToString() << '\n';
    return 1;
  }
  std::cout << "compiled " << artifact->record.size_bytes() << " bytes, static section: " << artifact->Section("static")->ToString() << '\n';

  // A changed source makes the cached artifact stale until recompiled.
  if (!client.Store(id, {{"type", "properties"}, {"namespace", "examples"}, {"lod", "1"}}, arrow::Buffer::FromString("hello")).ok()) return 1;

  auto lookup = client.Get(key);
  if (!lookup.ok()) {
    std::cerr << "Get failed: " << lookup.status().ToString() << '\n';
    return 1;
  }
  std::cout << "after update: " << resource::compiled::LookupStatusName(lookup->status) << '\n';

  auto removed = client.Remove(id);
  if (!removed.ok()) {
    std::cerr << "Remove failed: " << removed.status().ToString() << '\n';
    return 1;
  }

  resource::identity::ResourceRegistry::Instance().Teardown();
  return 0;
}
