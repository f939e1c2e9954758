#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/resource_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/identity/resource_registry.hpp"
#include "internal/runtime/server.hpp"
#include "internal/stream/socket_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/wire/frame.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::client::ResourceClient;
using resource::compiled::LookupStatus;
using resource::runtime::config::Endpoint;
using resource::runtime::config::RuntimeConfig;

constexpr auto kWait = std::chrono::milliseconds(2000);

resource::runtime::ServerOptions LoopbackOptions() {
  resource::runtime::ServerOptions options;
  options.bind_address    = "127.0.0.1:0";
  options.max_frame_bytes = 1u << 20;
  options.io_timeout      = std::chrono::milliseconds(5000);
  return options;
}

Endpoint Loopback(uint16_t port) {
  Endpoint endpoint;
  endpoint.set_host("127.0.0.1");
  endpoint.set_port(port);
  return endpoint;
}

RuntimeConfig BaseConfig() {
  RuntimeConfig config;
  config.mutable_remote()->set_max_retries(1);
  config.mutable_remote()->set_retry_backoff_ms(10);
  resource::config::ConfigLoader::ApplyDefaults(&config);
  return config;
}

/*
  sourced and compiled in one process, talking over loopback TCP, with
  a client that only knows their endpoints.
*/
struct Deployment {
  std::filesystem::path root;

  resource::factory::Application             source_app;
  std::unique_ptr<resource::runtime::Server> source_server;
  resource::factory::Application             compiled_app;
  std::unique_ptr<resource::runtime::Server> compiled_server;
  RuntimeConfig                              client_config;

  Deployment() {
    root = std::filesystem::temp_directory_path() /
           ("resource_loopback_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(root);

    auto source_config = BaseConfig();
    source_config.mutable_source()->mutable_local()->set_root_path((root / "source").string());
    source_app    = resource::factory::BuildSourceDaemon(source_config);
    source_server = std::make_unique<resource::runtime::Server>(LoopbackOptions(), source_app.dispatcher);
    source_server->Start();

    auto compiled_config = BaseConfig();
    *compiled_config.mutable_source()->mutable_remote() = Loopback(source_server->Port());
    auto* cache = compiled_config.mutable_compiled()->mutable_local();
    cache->set_tier(resource::runtime::config::STORAGE_TIER_RAM);
    compiled_app    = resource::factory::BuildCompiledDaemon(compiled_config);
    compiled_server = std::make_unique<resource::runtime::Server>(LoopbackOptions(), compiled_app.dispatcher);
    compiled_server->Start();
    compiled_app.relay->Start();

    client_config                                       = BaseConfig();
    *client_config.mutable_source()->mutable_remote()   = Loopback(source_server->Port());
    *client_config.mutable_compiled()->mutable_remote() = Loopback(compiled_server->Port());
    resource::identity::ResourceRegistry::Instance().Initialize(client_config);
  }

  ~Deployment() {
    resource::identity::ResourceRegistry::Instance().Teardown();
    compiled_app.relay->Stop();
    compiled_server->Stop();
    StopSource();
    std::filesystem::remove_all(root);
  }

  void StopSource() {
    if (!source_server) return;
    source_server->Stop();
    source_app.stack.bus->CloseAll();
    source_server.reset();
  }
};

std::shared_ptr<arrow::Buffer> Bytes(const std::string& text) {
  return arrow::Buffer::FromString(text);
}

ResourceKey Key(const ResourceID& id) {
  ResourceKey key;
  *key.mutable_id() = id;
  return key;
}

void TestStoreCompileAndStaleness(Deployment& deployment) {
  ResourceClient client(deployment.client_config);
  const auto     id = resource::util::NewResourceID();

  auto stored = client.Store(id, {{"type", "blob"}}, Bytes("v0"));
  assert(stored.ok() && *stored == 0);

  auto missing = client.Get(Key(id));
  assert(missing.ok() && missing->status == LookupStatus::kNotFound);

  auto compiled = client.Compile(Key(id));
  assert(compiled.ok());
  assert(compiled->payload->ToString() == "v0");
  assert(compiled->record.source_change_counter() == 0);
  assert(compiled->Section("static")->ToString() == "v0");

  auto hit = client.Get(Key(id));
  assert(hit.ok() && hit->status == LookupStatus::kOk);

  // identical content keeps the counter and the cache entry
  auto restored = client.Store(id, {{"type", "blob"}}, Bytes("v0"));
  assert(restored.ok() && *restored == 0);
  assert(client.Get(Key(id))->status == LookupStatus::kOk);

  auto changed = client.Store(id, {{"type", "blob"}}, Bytes("v1"));
  assert(changed.ok() && *changed == 1);
  assert(client.Get(Key(id))->status == LookupStatus::kStale);

  auto recompiled = client.Compile(Key(id));
  assert(recompiled.ok());
  assert(recompiled->payload->ToString() == "v1");
  assert(recompiled->record.source_change_counter() == 1);
  assert(client.Get(Key(id))->status == LookupStatus::kOk);

  auto fetched = client.Fetch(id);
  assert(fetched.ok());
  assert(fetched->record.change_counter() == 1);
  assert(fetched->payload->ToString() == "v1");
}

void TestRemovePropagates(Deployment& deployment) {
  ResourceClient client(deployment.client_config);
  const auto     id = resource::util::NewResourceID();

  assert(client.Store(id, {{"type", "blob"}}, Bytes("gone soon")).ok());
  assert(client.Compile(Key(id)).ok());

  auto removed = client.Remove(id);
  assert(removed.ok() && *removed == 1);

  assert(client.Fetch(id).status().IsKeyError());
  assert(client.Get(Key(id))->status == LookupStatus::kNotFound);
  assert(client.Compile(Key(id)).status().IsKeyError());
}

void TestUnknownTypeIsCompileFailure(Deployment& deployment) {
  ResourceClient client(deployment.client_config);
  const auto     id = resource::util::NewResourceID();

  assert(client.Store(id, {{"type", "no-such-compiler"}}, Bytes("x")).ok());
  auto result = client.Compile(Key(id));
  assert(result.status().IsExecutionError());

  // not cached
  assert(client.Get(Key(id))->status == LookupStatus::kNotFound);
}

void TestBundleFile(Deployment& deployment) {
  ResourceClient client(deployment.client_config);
  const auto     a = resource::util::NewResourceID();
  const auto     b = resource::util::NewResourceID();
  assert(client.Store(a, {{"type", "blob"}}, Bytes("alpha")).ok());
  assert(client.Store(b, {{"type", "properties"}, {"lod", "2"}}, Bytes("beta")).ok());

  const auto path = deployment.root / "bundle.rsb";
  assert(client.WriteBundleFile({Key(a), Key(b)}, path).ok());

  auto bundle = ResourceClient::ReadBundleFile(path);
  assert(bundle.ok());
  assert(bundle->Size() == 2);
  assert(bundle->Find(a)->payload->ToString() == "alpha");
  assert(bundle->Find(b)->Section("static")->ToString() == "beta");

  assert(client.BuildBundle({Key(a), Key(a)}).status().IsAlreadyExists());
}

// True once the server has closed the connection.
bool ServerClosed(resource::stream::SocketStream& connection) {
  try {
    return !resource::wire::ReadResponse(connection, 1u << 20);
  } catch (const resource::util::Unavailable&) {
    return true;
  }
}

void TestMalformedFramesCloseOnlyTheirConnection(Deployment& deployment) {
  const auto port = deployment.source_server->Port();

  // length field past max_frame_bytes
  auto oversized = resource::stream::SocketStream::Connect("127.0.0.1", port, kWait);
  oversized->SetTimeout(kWait);
  static_cast<resource::stream::Stream&>(*oversized).Write(std::string("\x00\x20\x00\x01\x01", 5));
  assert(ServerClosed(*oversized));

  // opcode 0x7f
  auto unknown = resource::stream::SocketStream::Connect("127.0.0.1", port, kWait);
  unknown->SetTimeout(kWait);
  static_cast<resource::stream::Stream&>(*unknown).Write(std::string("\x00\x00\x00\x01\x7f", 5));
  assert(ServerClosed(*unknown));

  // the daemon keeps serving new connections
  ResourceClient client(deployment.client_config);
  const auto     id = resource::util::NewResourceID();
  assert(client.Store(id, {{"type", "blob"}}, Bytes("still up")).ok());
  auto fetched = client.Fetch(id);
  assert(fetched.ok());
  assert(fetched->payload->ToString() == "still up");
}

void TestWatchAndLostSubscription(Deployment& deployment) {
  ResourceClient client(deployment.client_config);
  const auto     id = resource::util::NewResourceID();

  EventFilter filter;
  *filter.mutable_id() = id;
  auto watch           = client.Watch(filter);
  assert(watch.ok());
  auto channel = *watch;

  assert(client.Store(id, {{"type", "blob"}}, Bytes("first")).ok());
  assert(client.Store(id, {{"type", "blob"}}, Bytes("second")).ok());

  auto added = channel->PopFor(kWait);
  assert(added && added->kind() == CHANGE_KIND_ADDED && added->change_counter() == 0);
  auto modified = channel->PopFor(kWait);
  assert(modified && modified->kind() == CHANGE_KIND_MODIFIED && modified->change_counter() == 1);

  // a dropped upstream connection surfaces as Resync, then end of stream
  deployment.StopSource();
  auto resync = channel->PopFor(kWait);
  assert(resync && resync->kind() == CHANGE_KIND_RESYNC);
  assert(!channel->PopFor(kWait));
  assert(channel->IsClosed());

  // with sourced gone, source calls are unavailable rather than missing
  assert(client.Fetch(id).status().IsIOError());
}

} // namespace

int main() {
  Deployment deployment;

  TestStoreCompileAndStaleness(deployment);
  TestRemovePropagates(deployment);
  TestUnknownTypeIsCompileFailure(deployment);
  TestBundleFile(deployment);
  TestMalformedFramesCloseOnlyTheirConnection(deployment);
  TestWatchAndLostSubscription(deployment);

  std::cout << "resource_integration_pipeline_loopback: pass\n";
  return 0;
}
