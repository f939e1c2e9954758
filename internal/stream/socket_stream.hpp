#pragma once

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "internal/stream/stream.hpp"

namespace resource::stream {

/*
  TCP stream on top of asio.

  Every operation is an async op driven by a private io_context with a
  deadline, so a blocking call can time out. A zero timeout waits
  forever. I/O errors and timeouts surface as util::Unavailable.

  Thread safety:
    - one thread performs I/O
    - Interrupt() may be called from any thread
*/
class SocketStream final : public Stream {
 public:
  using Duration = std::chrono::milliseconds;

  SocketStream();
  ~SocketStream() override;

  SocketStream(const SocketStream&)            = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  static std::unique_ptr<SocketStream> Connect(const std::string& host, uint16_t port, Duration timeout);

  // Unconnected socket for acceptor->accept().
  asio::ip::tcp::socket& Socket() {
    return socket_;
  }

  void SetTimeout(Duration timeout) {
    timeout_ = timeout;
  }

  std::optional<std::shared_ptr<arrow::Buffer>> Read(int64_t max_len) override;
  int64_t                                       Write(const uint8_t* data, int64_t len) override;
  void                                          Close() override;

  using Stream::Write;

  // Non-blocking check for an orderly shutdown by the peer.
  bool PeerClosed();

  // Aborts the operation in progress and closes the socket.
  void Interrupt();

  std::string PeerAddress() const;

 private:
  void RunFor(Duration timeout);

  asio::io_context      io_;
  asio::ip::tcp::socket socket_;
  Duration              timeout_{0};
};

} // namespace resource::stream
