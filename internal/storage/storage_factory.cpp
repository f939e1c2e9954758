#include "storage_factory.hpp"

#include "disk/disk_arrow_store.hpp"
#include "ram/ram_arrow_store.hpp"

namespace resource::storage {

StorageBackendPtr StorageFactory::Build(Tier tier, const std::filesystem::path& root) {
  switch (tier) {
    case Tier::kRam:
      return std::make_shared<RamArrowStore>();
    case Tier::kDisk:
      break;
  }

  std::filesystem::path disk_root = root.empty() ? std::filesystem::path{"/tmp/resource-pipeline"} : root;
  return std::make_shared<DiskArrowStore>(std::move(disk_root));
}

} // namespace resource::storage
