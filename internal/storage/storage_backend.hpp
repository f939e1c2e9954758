#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace resource::storage {

enum class Tier {
  kRam,
  kDisk,
};

/*
  Blob storage abstraction.

  Every blob is represented as an Arrow Buffer. Keys are opaque
  file-name safe strings chosen by the caller (source blobs use the
  resource UUID, compiled blobs the encoded ResourceKey).

  Implementations:
    RAM   -> in-memory Arrow buffers
    DISK  -> Arrow file IO
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read entire blob into an Arrow buffer.

    Throws util::NotFound if the key has no blob.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Size
  // ------------------------------------------------------------------
  /*
    Return blob size in bytes.

    The default implementation falls back to Read() and inspects buffer size.
  */
  virtual uint64_t Size(const std::string& key) {
    return static_cast<uint64_t>(Read(key)->size());
  }

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist a buffer, replacing any previous blob for the key.
  */
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // ------------------------------------------------------------------
  // Remove
  // ------------------------------------------------------------------
  /*
    Remove a blob. Removing a missing key is not an error.
  */
  virtual void Remove(const std::string& key) = 0;

  virtual bool Contains(const std::string& key) = 0;

  virtual Tier TierType() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace resource::storage
