#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace resource::stream {

/*
  Byte channel shared by every backend.

  Local and remote backends only ever hand out Streams, which is what
  makes them interchangeable behind SourceBackend / CompiledBackend.

  Implementations:
    BufferStream  -> in-memory Arrow buffers
    FileStream    -> Arrow file IO
    SocketStream  -> asio TCP socket (may block)
*/
class Stream {
 public:
  virtual ~Stream() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read up to max_len bytes.

    Returns std::nullopt at end of stream. A returned buffer is never
    empty.
  */
  virtual std::optional<std::shared_ptr<arrow::Buffer>> Read(int64_t max_len) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  virtual int64_t Write(const uint8_t* data, int64_t len) = 0;

  virtual void Close() = 0;

  int64_t Write(const arrow::Buffer& buffer) {
    return Write(buffer.data(), buffer.size());
  }

  int64_t Write(std::string_view bytes) {
    return Write(reinterpret_cast<const uint8_t*>(bytes.data()), static_cast<int64_t>(bytes.size()));
  }

  // Drains the stream.
  std::shared_ptr<arrow::Buffer> ReadAll();

  // Exactly len bytes; throws util::Unavailable on early end of stream.
  std::shared_ptr<arrow::Buffer> ReadExact(int64_t len);
};

using StreamPtr = std::unique_ptr<Stream>;

inline constexpr int64_t kDefaultChunkSize = 64 * 1024;

} // namespace resource::stream
