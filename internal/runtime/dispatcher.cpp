#include "dispatcher.hpp"

#include "internal/service/compiled_service.hpp"
#include "internal/service/source_service.hpp"

namespace resource::runtime {

using namespace resource::pipeline::v1;
using wire::Opcode;

namespace {

[[noreturn]] void RejectOpcode(std::string_view daemon, Opcode opcode) {
  throw util::InvalidState(std::string(daemon) + " does not serve " + std::string(wire::OpcodeName(opcode)));
}

} // namespace

SourceDispatcher::SourceDispatcher(std::shared_ptr<service::SourceService> service) : service_(std::move(service)) {
}

std::string SourceDispatcher::Handle(Opcode opcode, const arrow::Buffer& payload) {
  switch (opcode) {
    case Opcode::kFetchSource:
      return service_->Fetch(DecodeRequest<FetchSourceRequest>(opcode, payload)).SerializeAsString();
    case Opcode::kStoreSource:
      return service_->Store(DecodeRequest<StoreSourceRequest>(opcode, payload)).SerializeAsString();
    case Opcode::kRemoveSource:
      return service_->Remove(DecodeRequest<RemoveSourceRequest>(opcode, payload)).SerializeAsString();
    case Opcode::kCurrentCounter:
      return service_->CurrentCounter(DecodeRequest<CurrentCounterRequest>(opcode, payload)).SerializeAsString();
    default:
      RejectOpcode("sourced", opcode);
  }
}

event::EventChannelPtr SourceDispatcher::Subscribe(const SubscribeRequest& req) {
  return service_->Subscribe(req);
}

CompiledDispatcher::CompiledDispatcher(std::shared_ptr<service::CompiledService> service) : service_(std::move(service)) {
}

std::string CompiledDispatcher::Handle(Opcode opcode, const arrow::Buffer& payload) {
  switch (opcode) {
    case Opcode::kGetCompiled:
      return service_->GetCompiled(DecodeRequest<GetCompiledRequest>(opcode, payload)).SerializeAsString();
    case Opcode::kPutCompiled:
      return service_->PutCompiled(DecodeRequest<PutCompiledRequest>(opcode, payload)).SerializeAsString();
    case Opcode::kCompile:
      return service_->Compile(DecodeRequest<CompileRequest>(opcode, payload)).SerializeAsString();
    default:
      RejectOpcode("compiled", opcode);
  }
}

event::EventChannelPtr CompiledDispatcher::Subscribe(const SubscribeRequest& req) {
  return service_->Subscribe(req);
}

} // namespace resource::runtime
