#include "server.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/status_mapping.hpp"

namespace resource::runtime {

using resource::observability::IntField;
using resource::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kSubscriptionPoll{100};
// a subscriber that stops reading is dropped after this long
constexpr std::chrono::milliseconds kSubscriptionWriteTimeout{10000};

asio::ip::tcp::endpoint ResolveBindAddress(asio::io_context& io, const std::string& bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos || colon + 1 == bind_address.size()) {
    throw util::InvalidState("bind address must be host:port, got '" + bind_address + "'");
  }

  std::string host = bind_address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
  const std::string port = bind_address.substr(colon + 1);

  std::error_code         ec;
  asio::ip::tcp::resolver resolver(io);
  auto                    results = resolver.resolve(host, port, asio::ip::tcp::resolver::passive, ec);
  if (ec || results.empty()) throw std::runtime_error("failed to resolve bind address " + bind_address + ": " + ec.message());
  return results.begin()->endpoint();
}

} // namespace

ServerOptions ServerOptions::FromConfig(const resource::runtime::config::ServerConfig& config) {
  ServerOptions options;
  options.bind_address    = config.bind_address();
  options.max_frame_bytes = config.max_frame_bytes();
  options.io_timeout      = std::chrono::milliseconds(config.io_timeout_ms());
  return options;
}

Server::Server(ServerOptions options, DispatcherPtr dispatcher)
    : options_(std::move(options)), dispatcher_(std::move(dispatcher)), acceptor_(io_) {
  if (!dispatcher_) throw util::InvalidState("server requires a dispatcher");
  if (options_.max_frame_bytes == 0) throw util::InvalidState("server max_frame_bytes must be positive");
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (running_) return;

  const auto endpoint = ResolveBindAddress(io_, options_.bind_address);

  std::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    std::error_code close_ec;
    acceptor_.close(close_ec);
    throw std::runtime_error("failed to listen on " + options_.bind_address + ": " + ec.message());
  }
  port_ = acceptor_.local_endpoint().port();

  running_ = true;
  DoAccept();
  accept_thread_ = std::thread([this] { io_.run(); });

  RESOURCE_LOG_INFO("listening", {StringField("bind_address", options_.bind_address), IntField("port", port_)});
}

void Server::Stop() {
  if (!running_.exchange(false)) return;

  asio::post(io_, [this] {
    std::error_code ec;
    acceptor_.close(ec);
  });
  if (accept_thread_.joinable()) accept_thread_.join();

  std::vector<std::unique_ptr<Connection>> connections;
  {
    std::lock_guard lock(connections_mutex_);
    connections.swap(connections_);
  }
  for (auto& connection : connections) {
    connection->stream->Interrupt();
  }
  for (auto& connection : connections) {
    if (connection->thread.joinable()) connection->thread.join();
  }

  RESOURCE_LOG_INFO("server stopped", {StringField("bind_address", options_.bind_address)});
}

size_t Server::ConnectionCount() const {
  std::lock_guard lock(connections_mutex_);
  size_t          open = 0;
  for (const auto& connection : connections_) {
    if (!connection->done) ++open;
  }
  return open;
}

void Server::DoAccept() {
  auto pending = std::make_shared<stream::SocketStream>();
  acceptor_.async_accept(pending->Socket(), [this, pending](const std::error_code& ec) {
    if (!running_ || ec == asio::error::operation_aborted) return;

    if (ec) {
      RESOURCE_LOG_WARN("accept failed", {StringField("error", ec.message())});
    } else {
      Launch(pending);
    }
    DoAccept();
  });
}

void Server::Launch(std::shared_ptr<stream::SocketStream> stream) {
  ReapFinished();

  auto connection    = std::make_unique<Connection>();
  connection->stream = std::move(stream);
  auto* raw          = connection.get();

  std::lock_guard lock(connections_mutex_);
  connection->thread = std::thread(&Server::Serve, this, raw);
  connections_.push_back(std::move(connection));
}

void Server::ReapFinished() {
  std::vector<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if ((*it)->done) {
        finished.push_back(std::move(*it));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) connection->thread.join();
  }
}

void Server::Serve(Connection* connection) {
  auto&      stream = *connection->stream;
  const auto peer   = stream.PeerAddress();
  stream.SetTimeout(options_.io_timeout);

  RESOURCE_LOG_DEBUG("connection accepted", {StringField("peer", peer)});
  try {
    while (running_) {
      auto frame = wire::ReadRequest(stream, options_.max_frame_bytes);
      if (!frame) break;

      if (frame->opcode == wire::Opcode::kSubscribe) {
        ServeSubscription(stream, *frame->payload);
        break;
      }
      Respond(stream, *frame);
    }
  } catch (const util::ProtocolError& e) {
    RESOURCE_LOG_WARN("closing connection after protocol error", {StringField("peer", peer), StringField("error", e.what())});
  } catch (const std::exception& e) {
    RESOURCE_LOG_DEBUG("connection ended", {StringField("peer", peer), StringField("reason", e.what())});
  }

  stream.Close();
  connection->done = true;
}

/*
  Unary request. Service errors become a non-OK response and the
  connection stays usable. A malformed payload is answered, then the
  ProtocolError propagates and closes the connection.
*/
void Server::Respond(stream::SocketStream& stream, const wire::Frame& frame) {
  std::string payload;
  try {
    payload = dispatcher_->Handle(frame.opcode, *frame.payload);
  } catch (const util::ProtocolError& e) {
    const auto error = wire::ToWireError(e);
    wire::WriteResponse(stream, frame.opcode, error.status, error.detail.SerializeAsString());
    throw;
  } catch (const std::exception& e) {
    const auto error = wire::ToWireError(e);
    wire::WriteResponse(stream, frame.opcode, error.status, error.detail.SerializeAsString());
    return;
  }

  wire::WriteResponse(stream, frame.opcode, wire::Status::kOk, payload);
}

/*
  SUBSCRIBE: acknowledge with an empty OK frame, then push ChangeEvent
  frames until the peer goes away, the channel closes or the server
  stops. Events still queued when the connection ends are lost.
*/
void Server::ServeSubscription(stream::SocketStream& stream, const arrow::Buffer& payload) {
  const auto request = DecodeRequest<resource::pipeline::v1::SubscribeRequest>(wire::Opcode::kSubscribe, payload);

  event::EventChannelPtr channel;
  try {
    channel = dispatcher_->Subscribe(request);
  } catch (const std::exception& e) {
    const auto error = wire::ToWireError(e);
    wire::WriteResponse(stream, wire::Opcode::kSubscribe, error.status, error.detail.SerializeAsString());
    return;
  }

  const auto peer = stream.PeerAddress();
  RESOURCE_LOG_INFO("subscriber attached", {StringField("peer", peer)});

  try {
    stream.SetTimeout(kSubscriptionWriteTimeout);
    wire::WriteResponse(stream, wire::Opcode::kSubscribe, wire::Status::kOk, {});

    while (running_) {
      auto event = channel->PopFor(kSubscriptionPoll);
      if (event) {
        wire::WriteResponse(stream, wire::Opcode::kSubscribe, wire::Status::kOk, event->SerializeAsString());
        continue;
      }
      if (channel->IsClosed() || stream.PeerClosed()) break;
    }
  } catch (...) {
    channel->Close();
    throw;
  }

  channel->Close();
  RESOURCE_LOG_INFO("subscriber detached", {StringField("peer", peer), IntField("dropped_events", static_cast<int64_t>(channel->Dropped()))});
}

} // namespace resource::runtime
