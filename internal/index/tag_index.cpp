#include "tag_index.hpp"

#include <stdexcept>

#include "internal/index/sorted_field.hpp"
#include "internal/util/errors.hpp"

namespace capsule::index {

namespace {

CapsuleVersion& RequireVersion(OwnerRecord& record, const std::string& version_id) {
  auto it = record.mutable_versions()->find(version_id);
  if (it == record.mutable_versions()->end()) {
    throw util::NotFound(util::NotFoundKind::kVersion, "version '" + version_id + "' not found for owner '" + record.owner() + "'");
  }
  return it->second;
}

} // namespace

void ValidateTag(const std::string& tag) {
  if (tag.empty()) {
    throw std::invalid_argument("tag must not be empty");
  }
  for (char c : tag) {
    if (c == '\0' || c == '\n' || c == '\r') {
      throw std::invalid_argument("tag contains invalid character");
    }
  }
}

OwnerRecord AddTag(OwnerRecord record, const std::string& version_id, const std::string& tag, const google::protobuf::Timestamp& at) {
  ValidateTag(tag);
  auto& version = RequireVersion(record, version_id);

  if (!InsertSorted(version.mutable_tags(), tag)) {
    return record;
  }
  InsertSorted((*record.mutable_tag_index())[tag].mutable_version_ids(), version_id);

  *version.mutable_updated_at() = at;
  *record.mutable_updated_at()  = at;
  return record;
}

OwnerRecord RemoveTag(OwnerRecord record, const std::string& version_id, const std::string& tag, const google::protobuf::Timestamp& at) {
  ValidateTag(tag);
  auto& version = RequireVersion(record, version_id);

  if (!EraseSorted(version.mutable_tags(), tag)) {
    return record;
  }

  auto* tag_index = record.mutable_tag_index();
  auto  members   = tag_index->find(tag);
  if (members != tag_index->end()) {
    EraseSorted(members->second.mutable_version_ids(), version_id);
    if (members->second.version_ids().empty()) {
      tag_index->erase(members);
    }
  }

  *version.mutable_updated_at() = at;
  *record.mutable_updated_at()  = at;
  return record;
}

std::vector<std::string> VersionsForTag(const OwnerRecord& record, const std::string& tag) {
  auto it = record.tag_index().find(tag);
  if (it == record.tag_index().end()) {
    return {};
  }
  return {it->second.version_ids().begin(), it->second.version_ids().end()};
}

} // namespace capsule::index
