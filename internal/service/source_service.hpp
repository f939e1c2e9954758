#pragma once

#include "internal/event/event_channel.hpp"
#include "resource/pipeline/v1.hpp"
#include "service_context.hpp"

namespace resource::service {

/*
  Request handlers of the source daemon. Transport independent: the
  runtime decodes frames into these requests and maps exceptions to
  wire statuses.
*/
class SourceService {
 public:
  explicit SourceService(ServiceContext ctx);

  resource::pipeline::v1::FetchSourceResponse Fetch(const resource::pipeline::v1::FetchSourceRequest& req);

  resource::pipeline::v1::StoreSourceResponse Store(const resource::pipeline::v1::StoreSourceRequest& req);

  resource::pipeline::v1::RemoveSourceResponse Remove(const resource::pipeline::v1::RemoveSourceRequest& req);

  resource::pipeline::v1::CurrentCounterResponse CurrentCounter(const resource::pipeline::v1::CurrentCounterRequest& req);

  event::EventChannelPtr Subscribe(const resource::pipeline::v1::SubscribeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace resource::service
