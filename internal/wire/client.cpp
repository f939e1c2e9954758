#include "client.hpp"

#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/status_mapping.hpp"

namespace resource::wire {

ClientOptions ClientOptions::FromConfig(const resource::runtime::config::RemoteConfig& config) {
  ClientOptions options;
  if (config.connect_timeout_ms() > 0) options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms());
  if (config.io_timeout_ms() > 0) options.io_timeout = std::chrono::milliseconds(config.io_timeout_ms());
  options.max_retries = config.max_retries();
  if (config.retry_backoff_ms() > 0) options.retry_backoff = std::chrono::milliseconds(config.retry_backoff_ms());
  if (config.max_frame_bytes() > 0) options.max_frame_bytes = config.max_frame_bytes();
  return options;
}

WireClient::WireClient(resource::runtime::config::Endpoint endpoint, ClientOptions options)
    : endpoint_(std::move(endpoint)), options_(options) {
  if (endpoint_.host().empty() || endpoint_.port() == 0 || endpoint_.port() > 65535) {
    throw util::InvalidState("invalid endpoint: " + Describe());
  }
}

std::string WireClient::Describe() const {
  return endpoint_.host() + ":" + std::to_string(endpoint_.port());
}

void WireClient::ThrowMalformed(Opcode opcode) {
  throw util::ProtocolError("malformed " + std::string(OpcodeName(opcode)) + " response");
}

std::unique_ptr<stream::SocketStream> WireClient::Connect() const {
  auto connection = stream::SocketStream::Connect(endpoint_.host(), static_cast<uint16_t>(endpoint_.port()), options_.connect_timeout);
  connection->SetTimeout(options_.io_timeout);
  return connection;
}

Frame WireClient::Exchange(stream::SocketStream& connection, Opcode opcode, const std::string& request, bool* sent) {
  WriteRequest(connection, opcode, request);
  if (sent) *sent = true;

  auto response = ReadResponse(connection, options_.max_frame_bytes);
  if (!response) throw util::Unavailable("connection closed by " + Describe());
  if (response->opcode != opcode) {
    throw util::ProtocolError("response opcode " + std::string(OpcodeName(response->opcode)) + " does not match request " +
                              std::string(OpcodeName(opcode)));
  }
  return std::move(*response);
}

std::shared_ptr<arrow::Buffer> WireClient::Call(Opcode opcode, const google::protobuf::Message& request) {
  const std::string payload = request.SerializeAsString();

  std::lock_guard lock(mutex_);
  Frame           response;
  for (uint32_t attempt = 0;; ++attempt) {
    bool sent = false;
    try {
      if (!connection_) connection_ = Connect();
      response = Exchange(*connection_, opcode, payload, &sent);
      break;
    } catch (const util::ProtocolError&) {
      connection_.reset();
      throw;
    } catch (const util::Unavailable& e) {
      // The stream may be mid-frame, never reuse it.
      connection_.reset();
      if (attempt >= options_.max_retries) throw;
      // the server may already have applied it
      if (sent && !IsReplaySafe(opcode)) throw;

      RESOURCE_LOG_WARN("request failed, retrying", {observability::StringField("endpoint", Describe()),
                                                     observability::StringField("opcode", OpcodeName(opcode)),
                                                     observability::IntField("attempt", attempt + 1),
                                                     observability::StringField("error", e.what())});
      std::this_thread::sleep_for(options_.retry_backoff * (attempt + 1));
    }
  }

  if (response.status != Status::kOk) RaiseWireError(response.status, *response.payload);
  return response.payload;
}

std::unique_ptr<stream::SocketStream> WireClient::OpenSubscription(const google::protobuf::Message& request) {
  const std::string payload = request.SerializeAsString();

  std::unique_ptr<stream::SocketStream> connection;
  Frame                                 ack;
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      connection = Connect();
      ack        = Exchange(*connection, Opcode::kSubscribe, payload);
      break;
    } catch (const util::Unavailable& e) {
      if (attempt >= options_.max_retries) throw;
      RESOURCE_LOG_WARN("subscribe failed, retrying",
                        {observability::StringField("endpoint", Describe()), observability::StringField("error", e.what())});
      std::this_thread::sleep_for(options_.retry_backoff * (attempt + 1));
    }
  }

  if (ack.status != Status::kOk) RaiseWireError(ack.status, *ack.payload);
  connection->SetTimeout(std::chrono::milliseconds(0));
  return connection;
}

} // namespace resource::wire
