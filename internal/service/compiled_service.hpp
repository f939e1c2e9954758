#pragma once

#include "internal/event/event_channel.hpp"
#include "resource/pipeline/v1.hpp"
#include "service_context.hpp"

namespace resource::service {

/*
  Request handlers of the compiled daemon.

  GetCompiled reports a stale or missing entry by throwing util::Stale
  or util::NotFound; the transport turns both into wire statuses.
  Subscribe serves the source events relayed onto the local bus.
*/
class CompiledService {
 public:
  explicit CompiledService(ServiceContext ctx);

  resource::pipeline::v1::GetCompiledResponse GetCompiled(const resource::pipeline::v1::GetCompiledRequest& req);

  resource::pipeline::v1::PutCompiledResponse PutCompiled(const resource::pipeline::v1::PutCompiledRequest& req);

  resource::pipeline::v1::CompileResponse Compile(const resource::pipeline::v1::CompileRequest& req);

  event::EventChannelPtr Subscribe(const resource::pipeline::v1::SubscribeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resource::service
