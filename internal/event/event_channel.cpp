#include "event_channel.hpp"

#include <algorithm>

namespace resource::event {

using resource::pipeline::v1::ChangeEvent;

ChangeEvent MakeResyncEvent() {
  ChangeEvent event;
  event.set_kind(resource::pipeline::v1::CHANGE_KIND_RESYNC);
  return event;
}

EventChannel::EventChannel(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {
}

EventChannel::~EventChannel() {
  if (!closed_ && on_close_) on_close_();
}

bool EventChannel::Push(const ChangeEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;

    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      resync_pending_ = true;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
  return true;
}

void EventChannel::PushResync() {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    resync_pending_ = true;
  }
  cv_.notify_one();
}

std::optional<ChangeEvent> EventChannel::TakeLocked() {
  if (resync_pending_) {
    resync_pending_ = false;
    return MakeResyncEvent();
  }
  if (queue_.empty()) return std::nullopt;

  ChangeEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::optional<ChangeEvent> EventChannel::Pop() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || resync_pending_ || !queue_.empty(); });

  return TakeLocked();
}

std::optional<ChangeEvent> EventChannel::PopFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || resync_pending_ || !queue_.empty(); });

  return TakeLocked();
}

void EventChannel::Close() {
  std::function<void()> on_close;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    on_close.swap(on_close_);
  }
  cv_.notify_all();

  if (on_close) on_close();
}

bool EventChannel::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

void EventChannel::SetOnClose(std::function<void()> on_close) {
  std::lock_guard lock(mutex_);
  on_close_ = std::move(on_close);
}

uint64_t EventChannel::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace resource::event
