#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/blob_store.hpp"

namespace capsule::storage {

/*
  In-memory blob storage.

  Backed by Arrow buffers held for the life of the process. Blobs are copied
  on write so later mutation of the caller's buffer cannot reach them.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
 public:
  RamBlobStore()           = default;
  ~RamBlobStore() override = default;

  void Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id) override;

  bool Remove(const std::string& owner, const std::string& version_id) override;

  void RemoveOwner(const std::string& owner) override;

  bool Exists(const std::string& owner, const std::string& version_id) override;

  std::optional<BlobInfo> Describe(const std::string& owner, const std::string& version_id) override;

  std::vector<BlobInfo> List(const std::string& owner) override;

  std::vector<std::string> ListOwners() override;

  std::string Location(const std::string& owner, const std::string& version_id) const override;

 private:
  struct Entry {
    std::shared_ptr<arrow::Buffer> buffer;
    util::TimePoint                modified_at;
  };

  using Container = std::map<std::string, Entry>;

  BlobInfo Info(const std::string& owner, const std::string& version_id, const Entry& entry) const;

  mutable std::shared_mutex                  mutex_;
  std::unordered_map<std::string, Container> owners_;
};

} // namespace capsule::storage
