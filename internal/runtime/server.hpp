#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dispatcher.hpp"
#include "internal/stream/socket_stream.hpp"

namespace resource::runtime::config {
class ServerConfig;
}

namespace resource::runtime {

struct ServerOptions {
  // host:port; port 0 picks a free port, see Server::Port()
  std::string               bind_address;
  uint32_t                  max_frame_bytes = 0;
  std::chrono::milliseconds io_timeout{0};

  static ServerOptions FromConfig(const resource::runtime::config::ServerConfig& config);
};

/*
  Wire protocol listener.

  One thread per accepted connection. A connection serves unary requests
  until the peer closes it, or switches to an event stream on SUBSCRIBE.
  A protocol error closes that connection only.
*/
class Server {
 public:
  Server(ServerOptions options, DispatcherPtr dispatcher);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Bound port, valid after Start().
  uint16_t Port() const {
    return port_;
  }

  size_t ConnectionCount() const;

 private:
  struct Connection {
    std::shared_ptr<stream::SocketStream> stream;
    std::thread                           thread;
    std::atomic<bool>                     done{false};
  };

  void DoAccept();
  void Launch(std::shared_ptr<stream::SocketStream> stream);
  void ReapFinished();

  void Serve(Connection* connection);
  void Respond(stream::SocketStream& stream, const wire::Frame& frame);
  void ServeSubscription(stream::SocketStream& stream, const arrow::Buffer& payload);

  ServerOptions options_;
  DispatcherPtr dispatcher_;

  asio::io_context        io_;
  asio::ip::tcp::acceptor acceptor_;
  std::thread             accept_thread_;
  std::atomic<bool>       running_{false};
  uint16_t                port_ = 0;

  mutable std::mutex                       connections_mutex_;
  std::vector<std::unique_ptr<Connection>> connections_;
};

} // namespace resource::runtime
