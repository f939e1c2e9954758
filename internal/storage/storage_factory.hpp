#pragma once

#include <filesystem>

#include "storage_backend.hpp"

namespace resource::storage {

/*
  Builds a blob store for one tier.

  Backends use this as:

      auto store = StorageFactory::Build(Tier::kDisk, root / "source");
*/

class StorageFactory {
 public:
  // root is ignored for the RAM tier.
  static StorageBackendPtr Build(Tier tier, const std::filesystem::path& root);
};

} // namespace resource::storage
