#include "owner_index.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/index/sorted_field.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace capsule::index {

namespace {

[[noreturn]] void Corrupt(const std::string& owner, const std::string& detail) {
  throw util::CorruptIndex("index for owner '" + owner + "' is inconsistent: " + detail);
}

} // namespace

OwnerRecord NewOwnerRecord(const std::string& owner, const google::protobuf::Timestamp& created_at) {
  OwnerRecord record;
  record.set_format_version(kFormatVersion);
  record.set_owner(owner);
  *record.mutable_created_at() = created_at;
  *record.mutable_updated_at() = created_at;
  return record;
}

bool IsNewer(const CapsuleVersion& a, const CapsuleVersion& b) {
  const int cmp = util::CompareTimestamps(a.created_at(), b.created_at());
  if (cmp != 0) {
    return cmp > 0;
  }
  return a.version_id() > b.version_id();
}

std::string RecomputeLatest(const OwnerRecord& record) {
  const CapsuleVersion* latest = nullptr;
  for (const auto& [version_id, version] : record.versions()) {
    if (latest == nullptr || IsNewer(version, *latest)) {
      latest = &version;
    }
  }
  return latest == nullptr ? std::string{} : latest->version_id();
}

OwnerRecord AddVersion(OwnerRecord record, CapsuleVersion version) {
  if (version.owner() != record.owner()) {
    throw std::invalid_argument("version owner '" + version.owner() + "' does not match record owner '" + record.owner() + "'");
  }
  if (version.version_id().empty()) {
    throw std::invalid_argument("version id must not be empty");
  }
  if (record.versions().count(version.version_id()) != 0) {
    throw std::invalid_argument("version '" + version.version_id() + "' is already indexed");
  }

  std::sort(version.mutable_tags()->begin(), version.mutable_tags()->end());
  version.mutable_tags()->erase(std::unique(version.mutable_tags()->begin(), version.mutable_tags()->end()), version.mutable_tags()->end());

  for (const auto& tag : version.tags()) {
    InsertSorted((*record.mutable_tag_index())[tag].mutable_version_ids(), version.version_id());
  }

  const auto version_id = version.version_id();
  (*record.mutable_versions())[version_id] = std::move(version);

  const auto& current = record.latest_version_id();
  if (current.empty() || IsNewer(record.versions().at(version_id), record.versions().at(current))) {
    record.set_latest_version_id(version_id);
  }
  return record;
}

OwnerRecord RemoveVersion(OwnerRecord record, const std::string& version_id) {
  auto* versions = record.mutable_versions();
  auto  it       = versions->find(version_id);
  if (it == versions->end()) {
    throw util::NotFound(util::NotFoundKind::kVersion, "version '" + version_id + "' not found for owner '" + record.owner() + "'");
  }
  versions->erase(it);

  auto* tag_index = record.mutable_tag_index();
  for (auto tag_it = tag_index->begin(); tag_it != tag_index->end();) {
    EraseSorted(tag_it->second.mutable_version_ids(), version_id);
    if (tag_it->second.version_ids().empty()) {
      tag_it = tag_index->erase(tag_it);
    } else {
      ++tag_it;
    }
  }

  if (record.latest_version_id() == version_id) {
    record.set_latest_version_id(RecomputeLatest(record));
  }
  return record;
}

void CheckConsistency(const OwnerRecord& record, const std::string& expected_owner) {
  if (record.owner() != expected_owner) {
    Corrupt(expected_owner, "document names owner '" + record.owner() + "'");
  }

  for (const auto& [key, version] : record.versions()) {
    if (version.version_id() != key) {
      Corrupt(expected_owner, "entry '" + key + "' carries version id '" + version.version_id() + "'");
    }
    if (version.owner() != expected_owner) {
      Corrupt(expected_owner, "version '" + key + "' belongs to '" + version.owner() + "'");
    }
    if (!version.has_created_at()) {
      Corrupt(expected_owner, "version '" + key + "' has no created_at");
    }
    if (version.fingerprint().size() != 64) {
      Corrupt(expected_owner, "version '" + key + "' has a malformed fingerprint");
    }
    if (!IsSortedUnique(version.tags())) {
      Corrupt(expected_owner, "version '" + key + "' has unsorted or duplicate tags");
    }
    for (const auto& tag : version.tags()) {
      auto members = record.tag_index().find(tag);
      if (members == record.tag_index().end() || !ContainsSorted(members->second.version_ids(), key)) {
        Corrupt(expected_owner, "tag '" + tag + "' on version '" + key + "' is missing from the tag index");
      }
    }
  }

  for (const auto& [tag, members] : record.tag_index()) {
    if (members.version_ids().empty()) {
      Corrupt(expected_owner, "tag '" + tag + "' has no members");
    }
    if (!IsSortedUnique(members.version_ids())) {
      Corrupt(expected_owner, "tag '" + tag + "' has unsorted or duplicate members");
    }
    for (const auto& version_id : members.version_ids()) {
      auto version = record.versions().find(version_id);
      if (version == record.versions().end()) {
        Corrupt(expected_owner, "tag '" + tag + "' references unknown version '" + version_id + "'");
      }
      if (!ContainsSorted(version->second.tags(), tag)) {
        Corrupt(expected_owner, "version '" + version_id + "' does not carry tag '" + tag + "'");
      }
    }
  }

  const auto expected_latest = RecomputeLatest(record);
  if (record.latest_version_id() != expected_latest) {
    Corrupt(expected_owner, "latest pointer '" + record.latest_version_id() + "' should be '" + expected_latest + "'");
  }
}

std::vector<CapsuleVersion> SortedNewestFirst(const OwnerRecord& record, const std::optional<std::string>& tag) {
  std::vector<CapsuleVersion> versions;
  versions.reserve(record.versions().size());
  for (const auto& [version_id, version] : record.versions()) {
    if (tag && !ContainsSorted(version.tags(), *tag)) continue;
    versions.push_back(version);
  }
  std::sort(versions.begin(), versions.end(), [](const CapsuleVersion& a, const CapsuleVersion& b) { return IsNewer(a, b); });
  return versions;
}

OwnerSummary Summarize(const OwnerRecord& record) {
  OwnerSummary summary;
  summary.set_owner(record.owner());
  summary.set_version_count(static_cast<uint64_t>(record.versions().size()));
  summary.set_latest_version_id(record.latest_version_id());
  *summary.mutable_created_at() = record.created_at();
  *summary.mutable_updated_at() = record.updated_at();

  for (const auto& [tag, members] : record.tag_index()) {
    (*summary.mutable_tag_counts())[tag] = static_cast<uint64_t>(members.version_ids().size());
  }

  const CapsuleVersion* earliest    = nullptr;
  uint64_t              total_bytes = 0;
  for (const auto& [version_id, version] : record.versions()) {
    total_bytes += version.byte_size();
    if (earliest == nullptr || IsNewer(*earliest, version)) {
      earliest = &version;
    }
  }
  summary.set_total_bytes(total_bytes);

  if (earliest != nullptr) {
    *summary.mutable_earliest_version_at() = earliest->created_at();
    *summary.mutable_latest_version_at()   = record.versions().at(record.latest_version_id()).created_at();
  }
  return summary;
}

} // namespace capsule::index
