#include "remote_compiled_backend.hpp"

#include "internal/util/errors.hpp"

namespace resource::compiled {

using namespace resource::pipeline::v1;
using wire::Opcode;

RemoteCompiledBackend::RemoteCompiledBackend(resource::runtime::config::Endpoint endpoint, wire::ClientOptions options)
    : client_(std::move(endpoint), options) {
}

LookupResult RemoteCompiledBackend::Get(const ResourceKey& key) {
  GetCompiledRequest request;
  *request.mutable_key() = key;

  GetCompiledResponse response;
  try {
    response = client_.Call<GetCompiledResponse>(Opcode::kGetCompiled, request);
  } catch (const util::NotFound&) {
    return {LookupStatus::kNotFound, std::nullopt};
  } catch (const util::Stale&) {
    return {LookupStatus::kStale, std::nullopt};
  }

  CompiledArtifact artifact;
  artifact.record  = std::move(*response.mutable_record());
  artifact.payload = arrow::Buffer::FromString(std::move(*response.mutable_payload()));
  return {LookupStatus::kOk, std::move(artifact)};
}

void RemoteCompiledBackend::Put(const CompiledArtifact& artifact) {
  PutCompiledRequest request;
  *request.mutable_record() = artifact.record;
  if (artifact.payload) request.set_payload(artifact.payload->ToString());

  client_.Call<PutCompiledResponse>(Opcode::kPutCompiled, request);
}

uint64_t RemoteCompiledBackend::Evict(const EvictionPolicy&) {
  return 0;
}

void RemoteCompiledBackend::Invalidate(const ResourceID&) {
}

CompiledArtifact RemoteCompiledBackend::Compile(const ResourceKey& key) {
  CompileRequest request;
  *request.mutable_key() = key;

  auto response = client_.Call<CompileResponse>(Opcode::kCompile, request);

  CompiledArtifact artifact;
  artifact.record  = std::move(*response.mutable_record());
  artifact.payload = arrow::Buffer::FromString(std::move(*response.mutable_payload()));
  return artifact;
}

} // namespace resource::compiled
