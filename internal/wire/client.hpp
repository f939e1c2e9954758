#pragma once

#include <google/protobuf/message.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/stream/socket_stream.hpp"
#include "internal/wire/frame.hpp"

namespace resource::wire {

struct ClientOptions {
  std::chrono::milliseconds connect_timeout{2000};
  std::chrono::milliseconds io_timeout{10000};
  uint32_t                  max_retries = 2;
  std::chrono::milliseconds retry_backoff{100};
  uint32_t                  max_frame_bytes = 64u * 1024u * 1024u;

  static ClientOptions FromConfig(const resource::runtime::config::RemoteConfig& config);
};

/*
  Request/response client for one daemon endpoint.

  Holds a single lazily opened connection; calls are serialized. A
  transport failure drops the connection and the call is retried up to
  max_retries times with linear backoff before util::Unavailable
  surfaces. Once a request that is not replay safe has been written,
  a lost reply is not retried. Error statuses from the server are raised as the matching
  exception and never retried.
*/
class WireClient {
 public:
  WireClient(resource::runtime::config::Endpoint endpoint, ClientOptions options);

  // OK response payload.
  std::shared_ptr<arrow::Buffer> Call(Opcode opcode, const google::protobuf::Message& request);

  template <typename Response>
  Response Call(Opcode opcode, const google::protobuf::Message& request) {
    auto     payload = Call(opcode, request);
    Response response;
    if (!response.ParseFromArray(payload->data(), static_cast<int>(payload->size()))) {
      ThrowMalformed(opcode);
    }
    return response;
  }

  /*
    Opens a dedicated connection and upgrades it with SUBSCRIBE. The
    returned stream has no read deadline and yields ChangeEvent frames.
  */
  std::unique_ptr<stream::SocketStream> OpenSubscription(const google::protobuf::Message& request);

  const ClientOptions& Options() const {
    return options_;
  }

  std::string Describe() const;

 private:
  [[noreturn]] static void ThrowMalformed(Opcode opcode);

  std::unique_ptr<stream::SocketStream> Connect() const;

  // Sets *sent once the request frame is fully written.
  Frame Exchange(stream::SocketStream& connection, Opcode opcode, const std::string& request, bool* sent = nullptr);

  resource::runtime::config::Endpoint endpoint_;
  ClientOptions                       options_;

  std::mutex                            mutex_;
  std::unique_ptr<stream::SocketStream> connection_;
};

} // namespace resource::wire
