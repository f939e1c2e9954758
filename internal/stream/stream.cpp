#include "stream.hpp"

#include <arrow/buffer_builder.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace resource::stream {

using resource::storage::common::Unwrap;

std::shared_ptr<arrow::Buffer> Stream::ReadAll() {
  arrow::BufferBuilder builder;
  while (auto chunk = Read(kDefaultChunkSize)) {
    Unwrap(builder.Append((*chunk)->data(), (*chunk)->size()));
  }
  return Unwrap(builder.Finish());
}

std::shared_ptr<arrow::Buffer> Stream::ReadExact(int64_t len) {
  arrow::BufferBuilder builder;
  Unwrap(builder.Reserve(len));
  while (builder.length() < len) {
    auto chunk = Read(len - builder.length());
    if (!chunk) {
      throw util::Unavailable("stream ended after " + std::to_string(builder.length()) + " of " + std::to_string(len) + " bytes");
    }
    Unwrap(builder.Append((*chunk)->data(), (*chunk)->size()));
  }
  return Unwrap(builder.Finish());
}

} // namespace resource::stream
