#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/bundle/bundle.hpp"
#include "internal/compiled/compiled_backend.hpp"
#include "internal/event/event_channel.hpp"
#include "internal/factory.hpp"
#include "internal/source/properties.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::client {

/*
  Facade over the pipeline for applications and the resource CLI.

  Every call is routed by ResourceRegistry::ResolveOrDefault() and runs
  against the backends of that location, built on first use and cached
  per location. Errors come back as arrow::Status:

    KeyError         not found
    IOError          backend unavailable
    ExecutionError   compile failure
    Cancelled        stale compiled entry
    SerializationError  protocol error or malformed bundle
    AlreadyExists    conflict
    Invalid          invalid argument or state
*/
class ResourceClient {
 public:
  struct SourcePayload {
    resource::pipeline::v1::SourceRecord record;
    std::shared_ptr<arrow::Buffer>       payload;
  };

  explicit ResourceClient(resource::runtime::config::RuntimeConfig config);

  arrow::Result<uint64_t> Store(const resource::pipeline::v1::ResourceID& id, const source::Properties& properties,
                                std::shared_ptr<arrow::Buffer> payload) const;

  arrow::Result<SourcePayload> Fetch(const resource::pipeline::v1::ResourceID& id) const;

  arrow::Result<uint64_t> Remove(const resource::pipeline::v1::ResourceID& id) const;

  // Cache-first compile; a stale or missing entry is rebuilt.
  arrow::Result<compiled::CompiledArtifact> Compile(const resource::pipeline::v1::ResourceKey& key) const;

  // Plain lookup. STALE and NOT_FOUND are results, not errors.
  arrow::Result<compiled::LookupResult> Get(const resource::pipeline::v1::ResourceKey& key) const;

  arrow::Result<bundle::Bundle> BuildBundle(const std::vector<resource::pipeline::v1::ResourceKey>& keys) const;

  arrow::Status WriteBundleFile(const std::vector<resource::pipeline::v1::ResourceKey>& keys, const std::filesystem::path& path) const;

  static arrow::Result<bundle::Bundle> ReadBundleFile(const std::filesystem::path& path);

  // Change events from the source backend; an empty filter id routes to
  // the default location.
  arrow::Result<event::EventChannelPtr> Watch(const resource::pipeline::v1::EventFilter& filter) const;

 private:
  std::shared_ptr<factory::PipelineStack> StackFor(const resource::pipeline::v1::ResourceID* id) const;

  compiled::CompiledArtifact CompileOn(const factory::PipelineStack& stack, const resource::pipeline::v1::ResourceKey& key) const;

  resource::runtime::config::RuntimeConfig config_;

  mutable std::mutex                                                     stacks_mutex_;
  mutable std::map<std::string, std::shared_ptr<factory::PipelineStack>> stacks_;
};

// Pipeline exception to the arrow::Status listed on ResourceClient.
arrow::Status ToStatus(const std::exception& e, std::string_view action);

// Dashed UUID text to ResourceID.
arrow::Result<resource::pipeline::v1::ResourceID> ParseResourceID(const std::string& uuid);

} // namespace resource::client
