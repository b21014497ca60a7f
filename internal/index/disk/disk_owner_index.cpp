#include "disk_owner_index.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <string>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace capsule::index {

using namespace capsule::storage::common;

DiskOwnerIndex::DiskOwnerIndex(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  CreateDirectories(IndexRoot(root_));
}

std::optional<OwnerRecord> DiskOwnerIndex::Load(const std::string& owner) {
  const auto path = IndexPath(root_, owner);

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      throw util::IOFailure("cannot stat " + path.string() + ": " + ec.message());
    }
    return std::nullopt;
  }

  const auto document = ReadFile(path)->ToString();

  OwnerRecord                              record;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(document, &record, options);
  if (!status.ok()) {
    throw util::CorruptIndex("index for owner '" + owner + "' is malformed: " + std::string(status.message()));
  }
  if (record.format_version() == 0 || record.format_version() > kFormatVersion) {
    throw util::CorruptIndex("index for owner '" + owner + "' has unsupported format version " + std::to_string(record.format_version()));
  }

  CheckConsistency(record, owner);
  return record;
}

void DiskOwnerIndex::Persist(const std::string& owner, const OwnerRecord& record) {
  const auto path = IndexPath(root_, owner);

  OwnerRecord document = record;
  document.set_format_version(kFormatVersion);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json, options);
  if (!status.ok()) {
    throw util::IOFailure("cannot serialize index for owner '" + owner + "': " + std::string(status.message()));
  }

  WriteFileAtomic(path, json, fsync_);
}

void DiskOwnerIndex::Remove(const std::string& owner) {
  const auto path = IndexPath(root_, owner);

  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw util::IOFailure("cannot remove " + path.string() + ": " + ec.message());
  }
}

std::vector<std::string> DiskOwnerIndex::ListOwners() {
  std::vector<std::string> owners;

  const auto      dir = IndexRoot(root_);
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    const auto& path = entry.path();
    if (path.extension().string() != kIndexSuffix) continue;

    auto owner = path.stem().string();
    if (owner.empty() || owner.front() == '.') continue;
    owners.push_back(std::move(owner));
  }
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw util::IOFailure("cannot list " + dir.string() + ": " + ec.message());
  }

  std::sort(owners.begin(), owners.end());
  return owners;
}

} // namespace capsule::index
