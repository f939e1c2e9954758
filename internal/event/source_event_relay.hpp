#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "event_bus.hpp"
#include "event_channel.hpp"

namespace resource::source {
class SourceBackend;
}
namespace resource::compiled {
class CompiledBackend;
}

namespace resource::event {

/*
  Background worker of the compiled daemon.

  Subscribes to every source change, drops compiled entries of removed
  resources, and republishes each event on the local bus for the
  daemon's own subscribers. A lost source subscription is forwarded as
  Resync and re-established after a backoff.
*/
class SourceEventRelay {
 public:
  SourceEventRelay(std::shared_ptr<source::SourceBackend> source, std::shared_ptr<compiled::CompiledBackend> compiled, EventBusPtr bus,
                   std::chrono::milliseconds retry_backoff);
  ~SourceEventRelay();

  void Start();
  void Stop();

  uint64_t Relayed() const {
    return relayed_;
  }

 private:
  void Run();
  void Relay(const resource::pipeline::v1::ChangeEvent& event);

  std::shared_ptr<source::SourceBackend>     source_;
  std::shared_ptr<compiled::CompiledBackend> compiled_;
  EventBusPtr                                bus_;
  const std::chrono::milliseconds            retry_backoff_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> relayed_{0};

  std::mutex              mutex_;
  std::condition_variable cv_;
  EventChannelPtr         channel_;
};

} // namespace resource::event
