#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/blob_store.hpp"

namespace capsule::storage {

/*
  Durable disk storage using Arrow IO.

  Layout:
    <root>/objects/<owner>/<version_id>

  Properties:
    - write-once, atomic rename
    - optional fsync
*/

class DiskBlobStore final : public BlobStore {
 public:
  explicit DiskBlobStore(std::filesystem::path root);

  void Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id) override;

  bool Remove(const std::string& owner, const std::string& version_id) override;

  void RemoveOwner(const std::string& owner) override;

  bool Exists(const std::string& owner, const std::string& version_id) override;

  std::optional<BlobInfo> Describe(const std::string& owner, const std::string& version_id) override;

  std::vector<BlobInfo> List(const std::string& owner) override;

  std::vector<std::string> ListOwners() override;

  std::string Location(const std::string& owner, const std::string& version_id) const override;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace capsule::storage
