#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "resource/pipeline/v1.hpp"

namespace resource::event {

/*
  Bounded delivery queue for one subscriber.

  Push never blocks. When the queue is full the oldest event is dropped
  and a single Resync marker is delivered before the remaining events,
  telling the consumer that it must re-fetch what it cares about.

  Closing wakes every waiter. Events already queued are still handed
  out after Close(); Pop() returns nullopt once the queue is drained.
*/
class EventChannel {
 public:
  explicit EventChannel(size_t capacity);

  // Runs the close hook if the owner drops the channel without Close().
  ~EventChannel();

  EventChannel(const EventChannel&)            = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  // Returns false if the channel is closed.
  bool Push(const resource::pipeline::v1::ChangeEvent& event);

  // Loss signal without a dropped event (lost upstream connection).
  void PushResync();

  // blocking wait
  std::optional<resource::pipeline::v1::ChangeEvent> Pop();

  // nullopt on timeout as well; check IsClosed() to tell them apart.
  std::optional<resource::pipeline::v1::ChangeEvent> PopFor(std::chrono::milliseconds timeout);

  void Close();
  bool IsClosed() const;

  // Called once from Close() or the destructor, on that thread.
  void SetOnClose(std::function<void()> on_close);

  uint64_t Dropped() const;
  size_t   Capacity() const {
    return capacity_;
  }

 private:
  std::optional<resource::pipeline::v1::ChangeEvent> TakeLocked();

  const size_t capacity_;

  mutable std::mutex                                  mutex_;
  std::condition_variable                             cv_;
  std::deque<resource::pipeline::v1::ChangeEvent>     queue_;
  bool                                                resync_pending_ = false;
  bool                                                closed_         = false;
  uint64_t                                            dropped_        = 0;
  std::function<void()>                               on_close_;
};

using EventChannelPtr = std::shared_ptr<EventChannel>;

resource::pipeline::v1::ChangeEvent MakeResyncEvent();

} // namespace resource::event
