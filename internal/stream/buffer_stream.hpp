#pragma once

#include <arrow/buffer.h>
#include <arrow/buffer_builder.h>

#include <memory>

#include "internal/stream/stream.hpp"

namespace resource::stream {

/*
  In-memory stream.

  Reads consume the buffer given at construction, writes append to an
  internal builder that Finish() turns into a buffer. Reads never see
  written bytes.
*/
class BufferStream final : public Stream {
 public:
  BufferStream();
  explicit BufferStream(std::shared_ptr<arrow::Buffer> source);

  static std::unique_ptr<BufferStream> FromString(std::string bytes);

  std::optional<std::shared_ptr<arrow::Buffer>> Read(int64_t max_len) override;
  int64_t                                       Write(const uint8_t* data, int64_t len) override;
  void                                          Close() override;

  using Stream::Write;

  // Bytes written so far.
  std::shared_ptr<arrow::Buffer> Finish();

 private:
  std::shared_ptr<arrow::Buffer> source_;
  int64_t                        position_ = 0;
  arrow::BufferBuilder           sink_;
  bool                           closed_ = false;
};

} // namespace resource::stream
