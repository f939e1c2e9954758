#include "buffer_stream.hpp"

#include <algorithm>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace resource::stream {

using resource::storage::common::Unwrap;

BufferStream::BufferStream() = default;

BufferStream::BufferStream(std::shared_ptr<arrow::Buffer> source) : source_(std::move(source)) {
}

std::unique_ptr<BufferStream> BufferStream::FromString(std::string bytes) {
  return std::make_unique<BufferStream>(arrow::Buffer::FromString(std::move(bytes)));
}

std::optional<std::shared_ptr<arrow::Buffer>> BufferStream::Read(int64_t max_len) {
  if (closed_ || !source_ || position_ >= source_->size() || max_len <= 0) return std::nullopt;

  const int64_t len   = std::min(max_len, source_->size() - position_);
  auto          slice = arrow::SliceBuffer(source_, position_, len);
  position_ += len;
  return slice;
}

int64_t BufferStream::Write(const uint8_t* data, int64_t len) {
  if (closed_) throw util::InvalidState("write to closed buffer stream");
  Unwrap(sink_.Append(data, len));
  return len;
}

void BufferStream::Close() {
  closed_ = true;
}

std::shared_ptr<arrow::Buffer> BufferStream::Finish() {
  return Unwrap(sink_.Finish());
}

} // namespace resource::stream
