#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>

#include "internal/stream/stream.hpp"

namespace resource::stream {

/*
  Local file stream using Arrow IO. A stream is either a reader or a
  writer, never both.
*/
class FileStream final : public Stream {
 public:
  static std::unique_ptr<FileStream> OpenRead(const std::filesystem::path& path);
  static std::unique_ptr<FileStream> OpenWrite(const std::filesystem::path& path);

  ~FileStream() override;

  std::optional<std::shared_ptr<arrow::Buffer>> Read(int64_t max_len) override;
  int64_t                                       Write(const uint8_t* data, int64_t len) override;
  void                                          Close() override;

  using Stream::Write;

 private:
  FileStream() = default;

  std::shared_ptr<arrow::io::ReadableFile>     reader_;
  std::shared_ptr<arrow::io::FileOutputStream> writer_;
};

} // namespace resource::stream
