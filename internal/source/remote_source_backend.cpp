#include "remote_source_backend.hpp"

#include "internal/observability/logging.hpp"
#include "internal/stream/buffer_stream.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace resource::source {

using namespace resource::pipeline::v1;
using wire::Opcode;

RemoteSourceBackend::RemoteSourceBackend(resource::runtime::config::Endpoint endpoint, wire::ClientOptions options, size_t queue_capacity)
    : client_(std::move(endpoint), options), queue_capacity_(queue_capacity) {
}

RemoteSourceBackend::~RemoteSourceBackend() {
  std::vector<std::unique_ptr<Subscription>> subscriptions;
  {
    std::lock_guard lock(subscriptions_mutex_);
    subscriptions.swap(subscriptions_);
  }
  for (auto& subscription : subscriptions) {
    subscription->connection->Interrupt();
    if (subscription->reader.joinable()) subscription->reader.join();
  }
}

SourceResource RemoteSourceBackend::Fetch(const ResourceID& id) {
  FetchSourceRequest request;
  *request.mutable_id() = id;

  auto response = client_.Call<FetchSourceResponse>(Opcode::kFetchSource, request);

  SourceResource resource;
  resource.record  = std::move(*response.mutable_record());
  resource.payload = std::make_unique<stream::BufferStream>(arrow::Buffer::FromString(std::move(*response.mutable_payload())));
  return resource;
}

uint64_t RemoteSourceBackend::Store(const ResourceID& id, const Properties& properties, stream::Stream& payload) {
  StoreSourceRequest request;
  *request.mutable_id() = id;
  CopyProperties(properties, request.mutable_properties());
  request.set_payload(payload.ReadAll()->ToString());

  return client_.Call<StoreSourceResponse>(Opcode::kStoreSource, request).change_counter();
}

uint64_t RemoteSourceBackend::Remove(const ResourceID& id) {
  RemoveSourceRequest request;
  *request.mutable_id() = id;
  return client_.Call<RemoveSourceResponse>(Opcode::kRemoveSource, request).change_counter();
}

uint64_t RemoteSourceBackend::CurrentCounter(const ResourceID& id) {
  CurrentCounterRequest request;
  *request.mutable_id() = id;
  return client_.Call<CurrentCounterResponse>(Opcode::kCurrentCounter, request).change_counter();
}

event::EventChannelPtr RemoteSourceBackend::Subscribe(const EventFilter& filter) {
  ReapFinished();

  SubscribeRequest request;
  *request.mutable_filter() = filter;

  std::shared_ptr<stream::SocketStream> connection = client_.OpenSubscription(request);

  auto channel = std::make_shared<event::EventChannel>(queue_capacity_);
  channel->SetOnClose([weak = std::weak_ptr<stream::SocketStream>(connection)] {
    if (auto c = weak.lock()) c->Interrupt();
  });

  auto subscription        = std::make_unique<Subscription>();
  subscription->connection = connection;
  subscription->reader     = std::thread(&RemoteSourceBackend::ReadEvents, connection, std::weak_ptr<event::EventChannel>(channel),
                                         client_.Options().max_frame_bytes, &subscription->done);

  std::lock_guard lock(subscriptions_mutex_);
  subscriptions_.push_back(std::move(subscription));
  return channel;
}

void RemoteSourceBackend::ReadEvents(std::shared_ptr<stream::SocketStream> connection, std::weak_ptr<event::EventChannel> channel,
                                     uint32_t max_frame_bytes, std::atomic<bool>* done) {
  std::string reason = "closed by server";
  try {
    while (true) {
      auto frame = wire::ReadResponse(*connection, max_frame_bytes);
      if (!frame) break;

      ChangeEvent event;
      if (frame->opcode != Opcode::kSubscribe || frame->status != wire::Status::kOk ||
          !event.ParseFromArray(frame->payload->data(), static_cast<int>(frame->payload->size()))) {
        reason = "malformed event frame";
        break;
      }

      auto target = channel.lock();
      if (!target || !target->Push(event)) {
        reason.clear();
        break;
      }
    }
  } catch (const std::exception& e) {
    reason = e.what();
  }

  // the subscriber is still listening: tell it events were lost
  if (!reason.empty()) {
    if (auto target = channel.lock(); target && !target->IsClosed()) {
      RESOURCE_LOG_WARN("subscription lost", {observability::StringField("peer", connection->PeerAddress()), observability::StringField("reason", reason)});
      target->PushResync();
      target->Close();
    }
  }

  connection->Close();
  done->store(true);
}

void RemoteSourceBackend::ReapFinished() {
  std::vector<std::unique_ptr<Subscription>> finished;
  {
    std::lock_guard lock(subscriptions_mutex_);
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
      if ((*it)->done.load()) {
        finished.push_back(std::move(*it));
        it = subscriptions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& subscription : finished) {
    if (subscription->reader.joinable()) subscription->reader.join();
  }
}

} // namespace resource::source
