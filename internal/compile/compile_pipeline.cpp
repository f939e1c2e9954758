#include "compile_pipeline.hpp"

#include <chrono>
#include <exception>

#include "internal/compiled/compiled_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/source/properties.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::compile {

using compiled::CompiledArtifact;
using compiled::LookupStatus;
using resource::pipeline::v1::ResourceKey;

CompilePipeline::CompilePipeline(source::SourceBackendPtr source, compiled::CompiledBackendPtr compiled, CompilerRegistryPtr registry,
                                 uint32_t compiler_version)
    : source_(std::move(source)), compiled_(std::move(compiled)), registry_(std::move(registry)), compiler_version_(compiler_version) {
  if (!source_ || !compiled_ || !registry_) throw util::InvalidState("compile pipeline requires source, compiled backend and registry");
  if (compiler_version_ == 0) throw util::InvalidState("compiler version must be positive");
}

CompiledArtifact CompilePipeline::Compile(const ResourceKey& requested) {
  const auto key        = compiled::NormalizeKey(requested, compiler_version_);
  const auto flight_key = compiled::BlobKey(key);

  std::promise<CompiledArtifact>       promise;
  std::shared_future<CompiledArtifact> waiting;
  {
    std::lock_guard lock(mutex_);
    auto            it = in_flight_.find(flight_key);
    if (it != in_flight_.end()) {
      waiting = it->second;
    } else {
      in_flight_.emplace(flight_key, promise.get_future().share());
    }
  }

  if (waiting.valid()) {
    RESOURCE_LOG_DEBUG("joining in-flight compile", {observability::StringField("key", flight_key)});
    return waiting.get();
  }

  // This caller leads the flight. The entry is dropped before the result
  // is published so a failed run is never observed by later callers.
  try {
    auto artifact = Run(key);
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(flight_key);
    }
    promise.set_value(artifact);
    return artifact;
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(flight_key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

CompiledArtifact CompilePipeline::Run(const ResourceKey& key) {
  observability::SpanScope span("resource.compile");
  span.SetAttribute("resource.key", compiled::DescribeKey(key));

  uint64_t live_counter = 0;
  try {
    live_counter = source_->CurrentCounter(key.id());
  } catch (const util::SourceUnavailable&) {
    throw;
  } catch (const util::Unavailable& e) {
    throw util::SourceUnavailable("source unavailable for " + util::Describe(key.id()) + ": " + e.what());
  }

  auto cached = compiled_->Get(key);
  if (cached.status == LookupStatus::kOk && cached.artifact && cached.artifact->record.source_change_counter() == live_counter) {
    span.AddEvent("cache_hit");
    return std::move(*cached.artifact);
  }

  source::SourceResource fetched;
  try {
    fetched = source_->Fetch(key.id());
  } catch (const util::SourceUnavailable&) {
    throw;
  } catch (const util::Unavailable& e) {
    throw util::SourceUnavailable("source unavailable for " + util::Describe(key.id()) + ": " + e.what());
  }

  const auto type    = source::TypeOf(source::ToProperties(fetched.record.properties()));
  auto       payload = fetched.payload->ReadAll();

  const auto started = std::chrono::steady_clock::now();
  CompileOutput output;
  try {
    output = registry_->Run(type, CompileInput{fetched.record, payload, key.platform()});
  } catch (const util::CompileFailure& e) {
    span.RecordException(e.what());
    RESOURCE_LOG_WARN("compile failed", {observability::StringField("key", compiled::DescribeKey(key)), observability::StringField("error", e.what())});
    throw;
  }
  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveCompileDurationMs(type, elapsed_ms);

  CompiledArtifact artifact;
  *artifact.record.mutable_key() = key;
  artifact.record.set_source_change_counter(fetched.record.change_counter());
  artifact.record.set_compiler_version(key.compiler_version());
  artifact.record.set_size_bytes(static_cast<uint64_t>(output.payload->size()));
  for (auto& section : output.sections) {
    *artifact.record.add_sections() = std::move(section);
  }
  artifact.payload = std::move(output.payload);

  compiled_->Put(artifact);

  RESOURCE_LOG_INFO("compiled", {observability::StringField("key", compiled::DescribeKey(key)), observability::StringField("type", type),
                                 observability::IntField("counter", static_cast<int64_t>(fetched.record.change_counter())),
                                 observability::IntField("size_bytes", static_cast<int64_t>(artifact.record.size_bytes()))});
  return artifact;
}

size_t CompilePipeline::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

} // namespace resource::compile
