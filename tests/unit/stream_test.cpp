#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "internal/stream/buffer_stream.hpp"
#include "internal/stream/file_stream.hpp"
#include "internal/stream/socket_stream.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using resource::stream::BufferStream;
using resource::stream::FileStream;
using resource::stream::SocketStream;

std::string AsString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return buffer->ToString();
}

void TestBufferStreamReadsInChunks() {
  auto stream = BufferStream::FromString("abcdefgh");

  auto first = stream->Read(3);
  assert(first && AsString(*first) == "abc");
  assert(AsString(stream->ReadAll()) == "defgh");
  assert(!stream->Read(3).has_value());
}

void TestBufferStreamWritesAreSeparateFromReads() {
  auto stream = BufferStream::FromString("source");
  stream->Write(std::string_view("sink"));
  assert(AsString(stream->Finish()) == "sink");
  assert(AsString(stream->ReadAll()) == "source");
}

void TestReadExactFailsOnShortStream() {
  auto stream = BufferStream::FromString("abc");
  bool threw  = false;
  try {
    (void)stream->ReadExact(4);
  } catch (const resource::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestFileStreamRoundTrip() {
  const auto dir = std::filesystem::temp_directory_path() / "resource_pipeline_stream_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "payload.bin";

  {
    auto out = FileStream::OpenWrite(path);
    out->Write(std::string_view("file payload"));
    out->Close();
  }

  auto in = FileStream::OpenRead(path);
  assert(AsString(in->ReadAll()) == "file payload");
  in->Close();

  std::filesystem::remove_all(dir);
}

struct SocketPair {
  std::unique_ptr<SocketStream> client;
  std::shared_ptr<SocketStream> server;
};

SocketPair Connect() {
  asio::io_context        io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  const auto              port = acceptor.local_endpoint().port();

  SocketPair pair;
  pair.server = std::make_shared<SocketStream>();
  std::thread accept_thread([&] { acceptor.accept(pair.server->Socket()); });
  pair.client = SocketStream::Connect("127.0.0.1", port, 2000ms);
  accept_thread.join();

  pair.server->SetTimeout(2000ms);
  return pair;
}

void TestSocketStreamTransfersBytes() {
  auto pair = Connect();

  pair.client->Write(std::string_view("hello over tcp"));
  assert(AsString(pair.server->ReadExact(14)) == "hello over tcp");

  pair.server->Write(std::string_view("reply"));
  assert(AsString(pair.client->ReadExact(5)) == "reply");
}

void TestSocketReadTimesOutAsUnavailable() {
  auto pair = Connect();
  pair.server->SetTimeout(100ms);

  bool threw = false;
  try {
    (void)pair.server->Read(16);
  } catch (const resource::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestPeerClosedDetectsOrderlyShutdown() {
  auto pair = Connect();
  assert(!pair.server->PeerClosed());

  pair.client->Close();

  bool closed = false;
  for (int i = 0; i < 100 && !closed; ++i) {
    closed = pair.server->PeerClosed();
    if (!closed) std::this_thread::sleep_for(10ms);
  }
  assert(closed);
}

void TestInterruptAbortsBlockedRead() {
  auto pair = Connect();
  pair.server->SetTimeout(0ms);

  bool        threw = false;
  std::thread reader([&] {
    try {
      (void)pair.server->Read(16);
    } catch (const resource::util::Unavailable&) {
      threw = true;
    }
  });

  std::this_thread::sleep_for(50ms);
  pair.server->Interrupt();
  reader.join();
  assert(threw);
}

void TestConnectToClosedPortIsUnavailable() {
  uint16_t port = 0;
  {
    asio::io_context        io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }

  bool threw = false;
  try {
    (void)SocketStream::Connect("127.0.0.1", port, 500ms);
  } catch (const resource::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBufferStreamReadsInChunks();
  TestBufferStreamWritesAreSeparateFromReads();
  TestReadExactFailsOnShortStream();
  TestFileStreamRoundTrip();
  TestSocketStreamTransfersBytes();
  TestSocketReadTimesOutAsUnavailable();
  TestPeerClosedDetectsOrderlyShutdown();
  TestInterruptAbortsBlockedRead();
  TestConnectToClosedPortIsUnavailable();

  std::cout << "resource_unit_streams: pass\n";
  return 0;
}
