#include "file_stream.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace resource::stream {

using resource::storage::common::Unwrap;

std::unique_ptr<FileStream> FileStream::OpenRead(const std::filesystem::path& path) {
  auto result = arrow::io::ReadableFile::Open(path.string());
  if (!result.ok()) throw util::NotFound("cannot open " + path.string() + ": " + result.status().ToString());

  std::unique_ptr<FileStream> stream(new FileStream());
  stream->reader_ = *result;
  return stream;
}

std::unique_ptr<FileStream> FileStream::OpenWrite(const std::filesystem::path& path) {
  std::unique_ptr<FileStream> stream(new FileStream());
  stream->writer_ = Unwrap(arrow::io::FileOutputStream::Open(path.string()));
  return stream;
}

FileStream::~FileStream() {
  try {
    Close();
  } catch (const std::exception& e) {
    RESOURCE_LOG_WARN("file stream close failed", {observability::StringField("error", e.what())});
  }
}

std::optional<std::shared_ptr<arrow::Buffer>> FileStream::Read(int64_t max_len) {
  if (!reader_ || reader_->closed()) return std::nullopt;

  auto chunk = Unwrap(reader_->Read(max_len));
  if (chunk->size() == 0) return std::nullopt;
  return chunk;
}

int64_t FileStream::Write(const uint8_t* data, int64_t len) {
  if (!writer_ || writer_->closed()) throw util::InvalidState("file stream is not writable");
  Unwrap(writer_->Write(data, len));
  return len;
}

void FileStream::Close() {
  if (reader_ && !reader_->closed()) Unwrap(reader_->Close());
  if (writer_ && !writer_->closed()) {
    Unwrap(writer_->Flush());
    Unwrap(writer_->Close());
  }
}

} // namespace resource::stream
