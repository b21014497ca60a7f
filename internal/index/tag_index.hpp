#pragma once

#include <string>
#include <vector>

#include "internal/index/owner_index.hpp"

namespace capsule::index {

/*
  Inverted tag -> version membership kept inside OwnerRecord.

  Both mutations are idempotent. `at` is stamped as the version's and the
  record's updated_at only when membership actually changes.
*/

// Throws NotFound(version) when the version is not indexed.
OwnerRecord AddTag(OwnerRecord record, const std::string& version_id, const std::string& tag, const google::protobuf::Timestamp& at);

// Removing an absent tag succeeds. Throws NotFound(version) when the version is not indexed.
OwnerRecord RemoveTag(OwnerRecord record, const std::string& version_id, const std::string& tag, const google::protobuf::Timestamp& at);

// Sorted; empty when the tag has no members.
std::vector<std::string> VersionsForTag(const OwnerRecord& record, const std::string& tag);

void ValidateTag(const std::string& tag);

} // namespace capsule::index
