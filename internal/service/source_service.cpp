#include "source_service.hpp"

#include "internal/source/source_backend.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "observe_request.hpp"

namespace resource::service {

using namespace resource::pipeline::v1;

SourceService::SourceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.source) throw util::InvalidState("source service requires a source backend");
}

FetchSourceResponse SourceService::Fetch(const FetchSourceRequest& req) {
  return ObserveRequest("SourceService.Fetch", &req.id(), [&] {
    auto resource = ctx_.source->Fetch(req.id());

    FetchSourceResponse resp;
    *resp.mutable_record() = std::move(resource.record);
    resp.set_payload(resource.payload->ReadAll()->ToString());
    return resp;
  });
}

StoreSourceResponse SourceService::Store(const StoreSourceRequest& req) {
  return ObserveRequest("SourceService.Store", &req.id(), [&] {
    stream::BufferStream payload(arrow::Buffer::FromString(req.payload()));

    StoreSourceResponse resp;
    resp.set_change_counter(ctx_.source->Store(req.id(), source::ToProperties(req.properties()), payload));
    return resp;
  });
}

RemoveSourceResponse SourceService::Remove(const RemoveSourceRequest& req) {
  return ObserveRequest("SourceService.Remove", &req.id(), [&] {
    RemoveSourceResponse resp;
    resp.set_change_counter(ctx_.source->Remove(req.id()));
    return resp;
  });
}

CurrentCounterResponse SourceService::CurrentCounter(const CurrentCounterRequest& req) {
  return ObserveRequest("SourceService.CurrentCounter", &req.id(), [&] {
    CurrentCounterResponse resp;
    resp.set_change_counter(ctx_.source->CurrentCounter(req.id()));
    return resp;
  });
}

event::EventChannelPtr SourceService::Subscribe(const SubscribeRequest& req) {
  const ResourceID* id = req.filter().has_id() ? &req.filter().id() : nullptr;
  return ObserveRequest("SourceService.Subscribe", id, [&] { return ctx_.source->Subscribe(req.filter()); });
}

} // namespace resource::service
