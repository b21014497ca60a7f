#include "memory_owner_index.hpp"

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace capsule::index {

std::optional<OwnerRecord> MemoryOwnerIndex::Load(const std::string& owner) {
  storage::common::ValidateComponent("owner", owner);

  std::string document;
  {
    std::lock_guard lock(mutex_);
    auto            it = documents_.find(owner);
    if (it == documents_.end()) return std::nullopt;
    document = it->second;
  }

  OwnerRecord record;
  if (!record.ParseFromString(document)) {
    throw util::CorruptIndex("index for owner '" + owner + "' is malformed");
  }
  CheckConsistency(record, owner);
  return record;
}

void MemoryOwnerIndex::Persist(const std::string& owner, const OwnerRecord& record) {
  storage::common::ValidateComponent("owner", owner);

  OwnerRecord document = record;
  document.set_format_version(kFormatVersion);

  std::string serialized;
  if (!document.SerializeToString(&serialized)) {
    throw util::IOFailure("cannot serialize index for owner '" + owner + "'");
  }

  std::lock_guard lock(mutex_);
  documents_[owner] = std::move(serialized);
}

void MemoryOwnerIndex::Remove(const std::string& owner) {
  std::lock_guard lock(mutex_);
  documents_.erase(owner);
}

std::vector<std::string> MemoryOwnerIndex::ListOwners() {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> owners;
  owners.reserve(documents_.size());
  for (const auto& [owner, document] : documents_) {
    owners.push_back(owner);
  }
  return owners;
}

} // namespace capsule::index
