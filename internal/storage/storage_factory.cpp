#include "storage_factory.hpp"

#include <stdexcept>
#include <string>

#include "disk/disk_blob_store.hpp"
#include "ram/ram_blob_store.hpp"

namespace capsule::storage {

std::filesystem::path StorageFactory::RootPath(const capsule::runtime::config::StorageConfig& cfg) {
  return cfg.root_path().empty() ? std::filesystem::path{kDefaultRootPath} : std::filesystem::path{cfg.root_path()};
}

BlobStorePtr StorageFactory::Build(const capsule::runtime::config::StorageConfig& cfg) {
  switch (cfg.backend()) {
    case capsule::runtime::config::STORAGE_BACKEND_MEMORY:
      return std::make_shared<RamBlobStore>();
    case capsule::runtime::config::STORAGE_BACKEND_UNSPECIFIED:
    case capsule::runtime::config::STORAGE_BACKEND_DISK:
      return std::make_shared<DiskBlobStore>(RootPath(cfg));
    default:
      throw std::invalid_argument("unsupported storage backend: " + std::to_string(static_cast<int>(cfg.backend())));
  }
}

} // namespace capsule::storage
