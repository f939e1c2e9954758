#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

#include "internal/event/event_channel.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/frame.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::service {
class SourceService;
class CompiledService;
} // namespace resource::service

namespace resource::runtime {

/*
  Transport adapter between the server loop and a service.

  Handle() returns the serialized response payload of a unary request.
  Errors:
    util::ProtocolError  the payload is not the opcode's request message
    util::InvalidState   this daemon does not serve the opcode
    anything else        thrown by the service, mapped by the server
*/
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual std::string Handle(wire::Opcode opcode, const arrow::Buffer& payload) = 0;

  virtual event::EventChannelPtr Subscribe(const resource::pipeline::v1::SubscribeRequest& req) = 0;
};

using DispatcherPtr = std::shared_ptr<Dispatcher>;

template <typename Request>
Request DecodeRequest(wire::Opcode opcode, const arrow::Buffer& payload) {
  Request request;
  if (!request.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
    throw util::ProtocolError("malformed " + std::string(wire::OpcodeName(opcode)) + " request");
  }
  return request;
}

// FETCH_SOURCE, STORE_SOURCE, REMOVE_SOURCE, CURRENT_COUNTER, SUBSCRIBE
class SourceDispatcher final : public Dispatcher {
 public:
  explicit SourceDispatcher(std::shared_ptr<service::SourceService> service);

  std::string            Handle(wire::Opcode opcode, const arrow::Buffer& payload) override;
  event::EventChannelPtr Subscribe(const resource::pipeline::v1::SubscribeRequest& req) override;

 private:
  std::shared_ptr<service::SourceService> service_;
};

// GET_COMPILED, PUT_COMPILED, COMPILE, SUBSCRIBE
class CompiledDispatcher final : public Dispatcher {
 public:
  explicit CompiledDispatcher(std::shared_ptr<service::CompiledService> service);

  std::string            Handle(wire::Opcode opcode, const arrow::Buffer& payload) override;
  event::EventChannelPtr Subscribe(const resource::pipeline::v1::SubscribeRequest& req) override;

 private:
  std::shared_ptr<service::CompiledService> service_;
};

} // namespace resource::runtime
