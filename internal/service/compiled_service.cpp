#include "compiled_service.hpp"

#include "internal/compile/compile_pipeline.hpp"
#include "internal/compiled/compiled_backend.hpp"
#include "internal/compiled/compiled_key.hpp"
#include "internal/event/event_bus.hpp"
#include "internal/util/errors.hpp"
#include "observe_request.hpp"

namespace resource::service {

using namespace resource::pipeline::v1;

CompiledService::CompiledService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.compiled || !ctx_.pipeline || !ctx_.events) {
    throw util::InvalidState("compiled service requires a compiled backend, a pipeline and an event bus");
  }
}

GetCompiledResponse CompiledService::GetCompiled(const GetCompiledRequest& req) {
  return ObserveRequest("CompiledService.GetCompiled", &req.key().id(), [&] {
    auto result = ctx_.compiled->Get(req.key());
    switch (result.status) {
      case compiled::LookupStatus::kOk:
        break;
      case compiled::LookupStatus::kStale:
        throw util::Stale("compiled entry is stale: " + compiled::DescribeKey(req.key()));
      case compiled::LookupStatus::kNotFound:
        throw util::NotFound("compiled entry not found: " + compiled::DescribeKey(req.key()));
    }

    GetCompiledResponse resp;
    *resp.mutable_record() = result.artifact->record;
    resp.set_payload(result.artifact->payload->ToString());
    return resp;
  });
}

PutCompiledResponse CompiledService::PutCompiled(const PutCompiledRequest& req) {
  return ObserveRequest("CompiledService.PutCompiled", &req.record().key().id(), [&] {
    if (!req.has_record() || !req.record().has_key()) throw util::InvalidState("put compiled: record key is required");

    compiled::CompiledArtifact artifact;
    artifact.record  = req.record();
    artifact.payload = arrow::Buffer::FromString(req.payload());
    artifact.record.set_size_bytes(static_cast<uint64_t>(artifact.payload->size()));
    compiled::ValidateSections(artifact);

    ctx_.compiled->Put(artifact);
    return PutCompiledResponse{};
  });
}

CompileResponse CompiledService::Compile(const CompileRequest& req) {
  return ObserveRequest("CompiledService.Compile", &req.key().id(), [&] {
    auto artifact = ctx_.pipeline->Compile(req.key());

    CompileResponse resp;
    *resp.mutable_record() = std::move(artifact.record);
    resp.set_payload(artifact.payload->ToString());
    return resp;
  });
}

event::EventChannelPtr CompiledService::Subscribe(const SubscribeRequest& req) {
  const ResourceID* id = req.filter().has_id() ? &req.filter().id() : nullptr;
  return ObserveRequest("CompiledService.Subscribe", id, [&] { return ctx_.events->SubscribeQueued(req.filter()); });
}

} // namespace resource::service
