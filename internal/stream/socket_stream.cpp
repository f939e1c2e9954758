#include "socket_stream.hpp"

#include <arrow/buffer.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace resource::stream {

using resource::storage::common::Unwrap;

SocketStream::SocketStream() : socket_(io_) {
}

SocketStream::~SocketStream() {
  std::error_code ec;
  socket_.close(ec);
}

std::unique_ptr<SocketStream> SocketStream::Connect(const std::string& host, uint16_t port, Duration timeout) {
  auto stream = std::make_unique<SocketStream>();

  std::error_code         ec;
  asio::ip::tcp::resolver resolver(stream->io_);
  auto                    endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) throw util::Unavailable("resolve " + host + ": " + ec.message());

  std::error_code connect_ec = asio::error::would_block;
  asio::async_connect(stream->socket_, endpoints, [&](const std::error_code& result, const asio::ip::tcp::endpoint&) { connect_ec = result; });
  stream->RunFor(timeout);

  if (connect_ec) {
    throw util::Unavailable("connect " + host + ":" + std::to_string(port) + ": " +
                            (connect_ec == asio::error::would_block ? std::string("timed out") : connect_ec.message()));
  }

  stream->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  stream->timeout_ = timeout;
  return stream;
}

/*
  Drive the io_context until the pending op completes or the deadline
  passes. On deadline the socket is closed so the op completes with
  operation_aborted.
*/
void SocketStream::RunFor(Duration timeout) {
  io_.restart();
  if (timeout.count() == 0) {
    io_.run();
    return;
  }

  io_.run_for(timeout);
  if (!io_.stopped()) {
    std::error_code ec;
    socket_.close(ec);
    io_.run();
  }
}

std::optional<std::shared_ptr<arrow::Buffer>> SocketStream::Read(int64_t max_len) {
  if (!socket_.is_open()) throw util::Unavailable("read on closed socket");

  auto buffer = Unwrap(arrow::AllocateResizableBuffer(max_len));

  std::error_code ec         = asio::error::would_block;
  std::size_t     bytes_read = 0;
  socket_.async_read_some(asio::buffer(buffer->mutable_data(), static_cast<std::size_t>(max_len)),
                          [&](const std::error_code& result, std::size_t n) {
                            ec         = result;
                            bytes_read = n;
                          });
  RunFor(timeout_);

  if (ec == asio::error::eof) return std::nullopt;
  if (ec == asio::error::would_block) throw util::Unavailable("socket read timed out");
  if (ec) throw util::Unavailable("socket read: " + ec.message());

  Unwrap(buffer->Resize(static_cast<int64_t>(bytes_read)));
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

int64_t SocketStream::Write(const uint8_t* data, int64_t len) {
  if (!socket_.is_open()) throw util::Unavailable("write on closed socket");

  std::error_code ec = asio::error::would_block;
  asio::async_write(socket_, asio::buffer(data, static_cast<std::size_t>(len)), [&](const std::error_code& result, std::size_t) { ec = result; });
  RunFor(timeout_);

  if (ec == asio::error::would_block) throw util::Unavailable("socket write timed out");
  if (ec) throw util::Unavailable("socket write: " + ec.message());
  return len;
}

void SocketStream::Close() {
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

bool SocketStream::PeerClosed() {
  if (!socket_.is_open()) return true;

  std::error_code ec;
  socket_.non_blocking(true, ec);
  uint8_t byte = 0;
  socket_.receive(asio::buffer(&byte, 1), asio::socket_base::message_peek, ec);
  std::error_code restore_ec;
  socket_.non_blocking(false, restore_ec);

  if (ec == asio::error::would_block || ec == asio::error::try_again) return false;
  return static_cast<bool>(ec);
}

void SocketStream::Interrupt() {
  asio::post(io_, [this] { Close(); });
}

std::string SocketStream::PeerAddress() const {
  std::error_code ec;
  auto            endpoint = socket_.remote_endpoint(ec);
  if (ec) return "unknown";
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace resource::stream
