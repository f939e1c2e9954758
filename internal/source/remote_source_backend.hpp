#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/source/source_backend.hpp"
#include "internal/stream/socket_stream.hpp"
#include "internal/wire/client.hpp"

namespace resource::source {

/*
  Source backend proxy to a sourced daemon.

  Each Subscribe() opens its own connection served by a reader thread.
  When that connection is lost the channel receives Resync and is
  closed; the subscriber has to subscribe again and re-fetch.
*/
class RemoteSourceBackend final : public SourceBackend {
 public:
  RemoteSourceBackend(resource::runtime::config::Endpoint endpoint, wire::ClientOptions options, size_t queue_capacity);
  ~RemoteSourceBackend() override;

  SourceResource Fetch(const resource::pipeline::v1::ResourceID& id) override;

  uint64_t Store(const resource::pipeline::v1::ResourceID& id, const Properties& properties, stream::Stream& payload) override;

  uint64_t Remove(const resource::pipeline::v1::ResourceID& id) override;

  uint64_t CurrentCounter(const resource::pipeline::v1::ResourceID& id) override;

  event::EventChannelPtr Subscribe(const resource::pipeline::v1::EventFilter& filter) override;

 private:
  struct Subscription {
    std::shared_ptr<stream::SocketStream> connection;
    std::thread                           reader;
    std::atomic<bool>                     done{false};
  };

  static void ReadEvents(std::shared_ptr<stream::SocketStream> connection, std::weak_ptr<event::EventChannel> channel,
                         uint32_t max_frame_bytes, std::atomic<bool>* done);

  void ReapFinished();

  wire::WireClient client_;
  size_t           queue_capacity_;

  std::mutex                                 subscriptions_mutex_;
  std::vector<std::unique_ptr<Subscription>> subscriptions_;
};

} // namespace resource::source
