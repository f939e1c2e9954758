#include "event_bus.hpp"

#include <algorithm>

namespace resource::event {

using resource::pipeline::v1::ChangeEvent;
using resource::pipeline::v1::EventFilter;

bool Matches(const EventFilter& filter, const ChangeEvent& event) {
  if (event.kind() == resource::pipeline::v1::CHANGE_KIND_RESYNC) return true;
  if (!filter.id().value().empty() && filter.id().value() != event.id().value()) return false;
  if (!filter.resource_namespace().empty() && filter.resource_namespace() != event.resource_namespace()) return false;
  return true;
}

EventBus::EventBus(size_t queue_capacity) : queue_capacity_(queue_capacity) {
}

SubscriptionId EventBus::Subscribe(EventFilter filter, EventCallback callback) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  callbacks_.push_back({id, std::move(filter), std::make_shared<EventCallback>(std::move(callback))});
  return id;
}

EventChannelPtr EventBus::SubscribeQueued(EventFilter filter) {
  auto channel = std::make_shared<EventChannel>(queue_capacity_);

  std::lock_guard lock(mutex_);
  queued_.push_back({std::move(filter), channel});
  return channel;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(), [&](const CallbackSubscriber& s) { return s.id == id; }),
                   callbacks_.end());
}

void EventBus::Publish(const ChangeEvent& event) {
  std::vector<std::shared_ptr<EventCallback>> targets;
  std::vector<EventChannelPtr>                channels;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : callbacks_) {
      if (Matches(s.filter, event)) targets.push_back(s.callback);
    }

    for (auto it = queued_.begin(); it != queued_.end();) {
      auto channel = it->channel.lock();
      if (!channel || channel->IsClosed()) {
        it = queued_.erase(it);
        continue;
      }
      if (Matches(it->filter, event)) channels.push_back(std::move(channel));
      ++it;
    }
  }

  // outside the lock so callbacks may (un)subscribe
  for (const auto& callback : targets) {
    (*callback)(event);
  }
  for (const auto& channel : channels) {
    channel->Push(event);
  }
}

void EventBus::CloseAll() {
  std::vector<QueuedSubscriber> queued;
  {
    std::lock_guard lock(mutex_);
    queued.swap(queued_);
  }
  for (auto& s : queued) {
    if (auto channel = s.channel.lock()) channel->Close();
  }
}

size_t EventBus::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  size_t          open = std::count_if(queued_.begin(), queued_.end(), [](const QueuedSubscriber& s) {
    auto channel = s.channel.lock();
    return channel && !channel->IsClosed();
  });
  return callbacks_.size() + open;
}

} // namespace resource::event
