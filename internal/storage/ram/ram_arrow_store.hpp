#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/storage_backend.hpp"

namespace resource::storage {

/*
  RAM storage tier.

  Backed by Arrow buffers stored in-memory.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamArrowStore final : public StorageBackend {
 public:
  RamArrowStore()           = default;
  ~RamArrowStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  bool Contains(const std::string& key) override;

  Tier TierType() const override {
    return Tier::kRam;
  }

 private:
  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace resource::storage
