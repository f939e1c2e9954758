#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/storage_backend.hpp"

namespace resource::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes
    - optional fsync
*/

class DiskArrowStore final : public StorageBackend {
 public:
  explicit DiskArrowStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  bool Contains(const std::string& key) override;

  Tier TierType() const override {
    return Tier::kDisk;
  }

 private:
  std::filesystem::path root_;
};

} // namespace resource::storage
