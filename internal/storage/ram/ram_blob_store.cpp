#include "ram_blob_store.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace capsule::storage {

using namespace capsule::storage::common;

BlobInfo RamBlobStore::Info(const std::string& owner, const std::string& version_id, const Entry& entry) const {
  BlobInfo info;
  info.owner       = owner;
  info.version_id  = version_id;
  info.location    = Location(owner, version_id);
  info.byte_size   = static_cast<uint64_t>(entry.buffer->size());
  info.modified_at = entry.modified_at;
  return info;
}

void RamBlobStore::Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  ValidateComponent("owner", owner);
  ValidateComponent("version id", version_id);
  if (!buffer) {
    throw std::invalid_argument("blob buffer must not be null");
  }

  auto copy = Unwrap(buffer->CopySlice(0, buffer->size()));

  std::unique_lock lock(mutex_);
  auto&            container = owners_[owner];
  if (container.count(version_id) != 0) {
    throw util::IOFailure("object already exists: " + Location(owner, version_id));
  }
  container.emplace(version_id, Entry{std::move(copy), util::Now()});
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& owner, const std::string& version_id) {
  std::shared_lock lock(mutex_);

  auto owner_it = owners_.find(owner);
  if (owner_it != owners_.end()) {
    auto it = owner_it->second.find(version_id);
    if (it != owner_it->second.end()) return it->second.buffer;
  }
  throw util::NotFound(util::NotFoundKind::kVersion, "object not found: " + Location(owner, version_id));
}

bool RamBlobStore::Remove(const std::string& owner, const std::string& version_id) {
  std::unique_lock lock(mutex_);

  auto owner_it = owners_.find(owner);
  if (owner_it == owners_.end()) return false;
  return owner_it->second.erase(version_id) > 0;
}

void RamBlobStore::RemoveOwner(const std::string& owner) {
  std::unique_lock lock(mutex_);

  auto owner_it = owners_.find(owner);
  if (owner_it == owners_.end()) return;
  if (!owner_it->second.empty()) {
    throw util::IOFailure("owner container is not empty: " + owner);
  }
  owners_.erase(owner_it);
}

bool RamBlobStore::Exists(const std::string& owner, const std::string& version_id) {
  std::shared_lock lock(mutex_);

  auto owner_it = owners_.find(owner);
  return owner_it != owners_.end() && owner_it->second.count(version_id) != 0;
}

std::optional<BlobInfo> RamBlobStore::Describe(const std::string& owner, const std::string& version_id) {
  std::shared_lock lock(mutex_);

  auto owner_it = owners_.find(owner);
  if (owner_it == owners_.end()) return std::nullopt;
  auto it = owner_it->second.find(version_id);
  if (it == owner_it->second.end()) return std::nullopt;
  return Info(owner, version_id, it->second);
}

std::vector<BlobInfo> RamBlobStore::List(const std::string& owner) {
  std::shared_lock lock(mutex_);

  std::vector<BlobInfo> blobs;
  auto                  owner_it = owners_.find(owner);
  if (owner_it == owners_.end()) return blobs;

  blobs.reserve(owner_it->second.size());
  for (const auto& [version_id, entry] : owner_it->second) {
    blobs.push_back(Info(owner, version_id, entry));
  }
  return blobs;
}

std::vector<std::string> RamBlobStore::ListOwners() {
  std::shared_lock lock(mutex_);

  std::vector<std::string> owners;
  owners.reserve(owners_.size());
  for (const auto& [owner, container] : owners_) {
    owners.push_back(owner);
  }
  std::sort(owners.begin(), owners.end());
  return owners;
}

std::string RamBlobStore::Location(const std::string& owner, const std::string& version_id) const {
  return "memory://" + owner + "/" + version_id;
}

} // namespace capsule::storage
