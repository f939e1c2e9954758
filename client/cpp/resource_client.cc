#include "client/cpp/resource_client.h"

#include <string_view>
#include <type_traits>

#include "internal/compiled/remote_compiled_backend.hpp"
#include "internal/identity/resource_registry.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/stream/file_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::client {

using namespace resource::pipeline::v1;

arrow::Status ToStatus(const std::exception& e, std::string_view action) {
  const std::string prefix = std::string(action) + ": ";
  if (dynamic_cast<const util::NotFound*>(&e)) return arrow::Status::KeyError(prefix, e.what());
  if (dynamic_cast<const util::Unavailable*>(&e)) return arrow::Status::IOError(prefix, e.what());
  if (dynamic_cast<const util::Stale*>(&e)) return arrow::Status::Cancelled(prefix, e.what());
  if (dynamic_cast<const util::CompileFailure*>(&e)) return arrow::Status::ExecutionError(prefix, e.what());
  if (dynamic_cast<const util::ProtocolError*>(&e)) return arrow::Status::SerializationError(prefix, e.what());
  if (dynamic_cast<const util::Conflict*>(&e)) return arrow::Status::AlreadyExists(prefix, e.what());
  if (dynamic_cast<const util::InvalidState*>(&e)) return arrow::Status::Invalid(prefix, e.what());
  return arrow::Status::UnknownError(prefix, e.what());
}

namespace {

template <typename Fn>
auto Capture(std::string_view action, Fn&& fn) -> arrow::Result<std::invoke_result_t<Fn>> {
  try {
    return fn();
  } catch (const std::exception& e) {
    return ToStatus(e, action);
  }
}

template <typename Fn>
arrow::Status CaptureStatus(std::string_view action, Fn&& fn) {
  try {
    fn();
    return arrow::Status::OK();
  } catch (const std::exception& e) {
    return ToStatus(e, action);
  }
}

} // namespace

arrow::Result<ResourceID> ParseResourceID(const std::string& uuid) {
  return Capture("parse uuid", [&] { return util::ParseResourceID(uuid); });
}

ResourceClient::ResourceClient(resource::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

std::shared_ptr<factory::PipelineStack> ResourceClient::StackFor(const ResourceID* id) const {
  const auto fallback = identity::DefaultLocation(config_);
  const auto location = id ? identity::ResourceRegistry::Instance().ResolveOrDefault(*id) : fallback;

  const bool own_config = location.kind_case() == identity::BackendLocation::KIND_NOT_SET ||
                         identity::DescribeLocation(location) == identity::DescribeLocation(fallback);
  const auto cache_key = own_config ? std::string("default") : identity::DescribeLocation(location);

  std::lock_guard lock(stacks_mutex_);
  auto            it = stacks_.find(cache_key);
  if (it != stacks_.end()) return it->second;

  auto stack = std::make_shared<factory::PipelineStack>(
      factory::BuildPipelineStack(own_config ? config_ : factory::ConfigForLocation(config_, location)));
  stacks_.emplace(cache_key, stack);
  return stack;
}

compiled::CompiledArtifact ResourceClient::CompileOn(const factory::PipelineStack& stack, const ResourceKey& key) const {
  if (stack.pipeline) return stack.pipeline->Compile(key);

  auto* remote = dynamic_cast<compiled::RemoteCompiledBackend*>(stack.compiled.get());
  if (!remote) throw util::InvalidState("no compile pipeline for this location");
  return remote->Compile(key);
}

arrow::Result<uint64_t> ResourceClient::Store(const ResourceID& id, const source::Properties& properties,
                                              std::shared_ptr<arrow::Buffer> payload) const {
  return Capture("store " + util::Describe(id), [&] {
    stream::BufferStream in(std::move(payload));
    return StackFor(&id)->source->Store(id, properties, in);
  });
}

arrow::Result<ResourceClient::SourcePayload> ResourceClient::Fetch(const ResourceID& id) const {
  return Capture("fetch " + util::Describe(id), [&] {
    auto          resource = StackFor(&id)->source->Fetch(id);
    SourcePayload result;
    result.record  = std::move(resource.record);
    result.payload = resource.payload->ReadAll();
    return result;
  });
}

arrow::Result<uint64_t> ResourceClient::Remove(const ResourceID& id) const {
  return Capture("remove " + util::Describe(id), [&] { return StackFor(&id)->source->Remove(id); });
}

arrow::Result<compiled::CompiledArtifact> ResourceClient::Compile(const ResourceKey& key) const {
  return Capture("compile " + util::Describe(key.id()), [&] { return CompileOn(*StackFor(&key.id()), key); });
}

arrow::Result<compiled::LookupResult> ResourceClient::Get(const ResourceKey& key) const {
  return Capture("get " + util::Describe(key.id()), [&] { return StackFor(&key.id())->compiled->Get(key); });
}

arrow::Result<bundle::Bundle> ResourceClient::BuildBundle(const std::vector<ResourceKey>& keys) const {
  return Capture("bundle", [&] {
    bundle::BundleBuilder builder([this](const ResourceKey& key) { return CompileOn(*StackFor(&key.id()), key); });
    return builder.Build(keys);
  });
}

arrow::Status ResourceClient::WriteBundleFile(const std::vector<ResourceKey>& keys, const std::filesystem::path& path) const {
  ARROW_ASSIGN_OR_RAISE(auto built, BuildBundle(keys));
  return CaptureStatus("write bundle " + path.string(), [&] {
    auto out = stream::FileStream::OpenWrite(path);
    bundle::WriteBundle(built, *out);
    out->Close();
  });
}

arrow::Result<bundle::Bundle> ResourceClient::ReadBundleFile(const std::filesystem::path& path) {
  return Capture("read bundle " + path.string(), [&] {
    auto in = stream::FileStream::OpenRead(path);
    return bundle::ReadBundle(*in);
  });
}

arrow::Result<event::EventChannelPtr> ResourceClient::Watch(const EventFilter& filter) const {
  return Capture("watch", [&] { return StackFor(filter.has_id() ? &filter.id() : nullptr)->source->Subscribe(filter); });
}

} // namespace resource::client
