#include "disk_blob_store.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace capsule::storage {

using namespace capsule::storage::common;

namespace {

util::TimePoint ToSystemTime(std::filesystem::file_time_type file_time) {
  return std::chrono::time_point_cast<util::Clock::duration>(file_time - std::filesystem::file_time_type::clock::now() + util::Clock::now());
}

std::optional<BlobInfo> Stat(const std::filesystem::path& path, const std::string& owner, const std::string& version_id) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      throw util::IOFailure("cannot stat " + path.string() + ": " + ec.message());
    }
    return std::nullopt;
  }

  BlobInfo info;
  info.owner      = owner;
  info.version_id = version_id;
  info.location   = path.string();
  info.byte_size  = std::filesystem::file_size(path, ec);
  if (ec) {
    throw util::IOFailure("cannot stat " + path.string() + ": " + ec.message());
  }
  auto modified = std::filesystem::last_write_time(path, ec);
  if (ec) {
    throw util::IOFailure("cannot stat " + path.string() + ": " + ec.message());
  }
  info.modified_at = ToSystemTime(modified);
  return info;
}

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root) : root_(std::move(root)) {
  CreateDirectories(ObjectsRoot(root_));
}

/*
  Write-once:
      mkdir owner -> write tmp -> (fsync) -> rename, refusing to clobber
*/
void DiskBlobStore::Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  if (!buffer) {
    throw std::invalid_argument("blob buffer must not be null");
  }

  auto final_path = ObjectPath(root_, owner, version_id);

  std::error_code ec;
  if (std::filesystem::exists(final_path, ec)) {
    throw util::IOFailure("object already exists: " + final_path.string());
  }

  CreateDirectories(final_path.parent_path());
  WriteFileAtomic(final_path, buffer->data(), buffer->size(), fsync, /*no_clobber=*/true);
}

std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& owner, const std::string& version_id) {
  auto path = ObjectPath(root_, owner, version_id);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw util::NotFound(util::NotFoundKind::kVersion, "object not found: " + path.string());
  }

  return ReadFile(path);
}

bool DiskBlobStore::Remove(const std::string& owner, const std::string& version_id) {
  auto path = ObjectPath(root_, owner, version_id);

  std::error_code ec;
  bool            removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw util::IOFailure("cannot remove " + path.string() + ": " + ec.message());
  }
  return removed;
}

void DiskBlobStore::RemoveOwner(const std::string& owner) {
  auto dir = OwnerObjectDir(root_, owner);

  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return;
  }

  // Leftover temp files from interrupted writes go with the container.
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (!IsTempName(entry.path().filename().string())) {
      throw util::IOFailure("owner container is not empty: " + dir.string());
    }
  }
  if (ec) {
    throw util::IOFailure("cannot list " + dir.string() + ": " + ec.message());
  }

  std::filesystem::remove_all(dir, ec);
  if (ec) {
    throw util::IOFailure("cannot remove " + dir.string() + ": " + ec.message());
  }
}

bool DiskBlobStore::Exists(const std::string& owner, const std::string& version_id) {
  std::error_code ec;
  return std::filesystem::is_regular_file(ObjectPath(root_, owner, version_id), ec);
}

std::optional<BlobInfo> DiskBlobStore::Describe(const std::string& owner, const std::string& version_id) {
  return Stat(ObjectPath(root_, owner, version_id), owner, version_id);
}

std::vector<BlobInfo> DiskBlobStore::List(const std::string& owner) {
  std::vector<BlobInfo> blobs;

  auto            dir = OwnerObjectDir(root_, owner);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return blobs;
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    auto name = entry.path().filename().string();
    if (IsTempName(name) || name.front() == '.') continue;

    if (auto info = Stat(entry.path(), owner, name)) {
      blobs.push_back(std::move(*info));
    }
  }
  if (ec) {
    throw util::IOFailure("cannot list " + dir.string() + ": " + ec.message());
  }

  std::sort(blobs.begin(), blobs.end(), [](const BlobInfo& a, const BlobInfo& b) { return a.version_id < b.version_id; });
  return blobs;
}

std::vector<std::string> DiskBlobStore::ListOwners() {
  std::vector<std::string> owners;

  auto            dir = ObjectsRoot(root_);
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return owners;
  }

  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    auto            name = entry.path().filename().string();
    std::error_code type_ec;
    if (name.front() == '.' || !entry.is_directory(type_ec)) continue;
    owners.push_back(std::move(name));
  }
  if (ec) {
    throw util::IOFailure("cannot list " + dir.string() + ": " + ec.message());
  }

  std::sort(owners.begin(), owners.end());
  return owners;
}

std::string DiskBlobStore::Location(const std::string& owner, const std::string& version_id) const {
  return ObjectPath(root_, owner, version_id).string();
}

} // namespace capsule::storage
