#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/compile/compiler_registry.hpp"
#include "internal/compiled/compiled_backend.hpp"
#include "internal/source/source_backend.hpp"

namespace resource::compile {

/*
  Cache-first compile of one ResourceKey.

    1. resolve the live source counter
    2. compiled Get; OK returns the cached artifact
    3. fetch the source, run the transform for (type, platform)
    4. tag with the fetched counter and compiler version, Put

  Single flight: concurrent calls for the same key share one run. A
  failure reaches every waiter, is never cached, and the next call
  starts a fresh run.

  Errors:
    util::NotFound           the source does not exist
    util::SourceUnavailable  the source backend cannot be reached
    util::CompileFailure     no transform, or the transform rejected it
*/
class CompilePipeline {
 public:
  CompilePipeline(source::SourceBackendPtr source, compiled::CompiledBackendPtr compiled, CompilerRegistryPtr registry,
                  uint32_t compiler_version);

  compiled::CompiledArtifact Compile(const resource::pipeline::v1::ResourceKey& key);

  size_t InFlight() const;

  uint32_t CompilerVersion() const {
    return compiler_version_;
  }

 private:
  compiled::CompiledArtifact Run(const resource::pipeline::v1::ResourceKey& key);

  source::SourceBackendPtr     source_;
  compiled::CompiledBackendPtr compiled_;
  CompilerRegistryPtr          registry_;
  const uint32_t               compiler_version_;

  mutable std::mutex                                                          mutex_;
  std::unordered_map<std::string, std::shared_future<compiled::CompiledArtifact>> in_flight_;
};

using CompilePipelinePtr = std::shared_ptr<CompilePipeline>;

} // namespace resource::compile
