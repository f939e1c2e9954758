#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/event/event_channel.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::event {

using EventCallback  = std::function<void(const resource::pipeline::v1::ChangeEvent&)>;
using SubscriptionId = uint64_t;

// Resync always matches; empty filter fields match everything.
bool Matches(const resource::pipeline::v1::EventFilter& filter, const resource::pipeline::v1::ChangeEvent& event);

/*
  In-process change event fan-out.

  Publish() first calls every matching callback subscriber on the
  publishing thread in registration order, then pushes to every
  matching queued subscriber. It never blocks on a slow consumer.
*/
class EventBus {
 public:
  explicit EventBus(size_t queue_capacity);

  SubscriptionId Subscribe(resource::pipeline::v1::EventFilter filter, EventCallback callback);

  // Channel for a remote subscriber. Closing or dropping the channel
  // unsubscribes it; the bus holds only a weak reference.
  EventChannelPtr SubscribeQueued(resource::pipeline::v1::EventFilter filter);

  void Unsubscribe(SubscriptionId id);

  void Publish(const resource::pipeline::v1::ChangeEvent& event);

  // Closes every queued channel.
  void CloseAll();

  size_t SubscriberCount() const;

 private:
  struct CallbackSubscriber {
    SubscriptionId                      id;
    resource::pipeline::v1::EventFilter filter;
    std::shared_ptr<EventCallback>      callback;
  };

  struct QueuedSubscriber {
    resource::pipeline::v1::EventFilter filter;
    std::weak_ptr<EventChannel>         channel;
  };

  const size_t queue_capacity_;

  mutable std::mutex              mutex_;
  SubscriptionId                  next_id_ = 1;
  std::vector<CallbackSubscriber> callbacks_;
  std::vector<QueuedSubscriber>   queued_;
};

using EventBusPtr = std::shared_ptr<EventBus>;

} // namespace resource::event
