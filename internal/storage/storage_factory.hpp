#pragma once

#include <filesystem>

#include "config/config.pb.h"
#include "internal/storage/blob_store.hpp"

namespace capsule::storage {

/*
  Builds the blob backend from configuration.

      auto blobs = StorageFactory::Build(config.storage());
      blobs->Write(owner, version_id, buffer, fsync);
*/

class StorageFactory {
 public:
  static constexpr const char* kDefaultRootPath = "/tmp/capsule-store";

  static std::filesystem::path RootPath(const capsule::runtime::config::StorageConfig& cfg);

  static BlobStorePtr Build(const capsule::runtime::config::StorageConfig& cfg);
};

} // namespace capsule::storage
