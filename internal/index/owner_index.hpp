#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capsule/store/v1.hpp"

namespace capsule::index {

using capsule::store::v1::CapsuleVersion;
using capsule::store::v1::OwnerRecord;
using capsule::store::v1::OwnerSummary;

inline constexpr uint32_t kFormatVersion = 1;

/*
  Durable per-owner index.

  Each owner is one document, replaced wholesale on Persist. Callers own
  serialization of read-modify-write cycles for an owner.
*/
class OwnerIndex {
 public:
  virtual ~OwnerIndex() = default;

  /*
    std::nullopt when the owner has never been persisted.
    Throws CorruptIndex when an existing document cannot be trusted.
  */
  virtual std::optional<OwnerRecord> Load(const std::string& owner) = 0;

  virtual void Persist(const std::string& owner, const OwnerRecord& record) = 0;

  virtual void Remove(const std::string& owner) = 0;

  virtual std::vector<std::string> ListOwners() = 0;
};

using OwnerIndexPtr = std::shared_ptr<OwnerIndex>;

// ------------------------------------------------------------------
// Pure record transformations
// ------------------------------------------------------------------

OwnerRecord NewOwnerRecord(const std::string& owner, const google::protobuf::Timestamp& created_at);

// Greatest created_at wins, ties go to the greater version_id.
bool IsNewer(const CapsuleVersion& a, const CapsuleVersion& b);

// Empty when the record holds no versions.
std::string RecomputeLatest(const OwnerRecord& record);

/*
  Insert a version and recompute the latest pointer. The version's tags are
  indexed as well. Throws std::invalid_argument on owner mismatch or a
  version id that is already present.
*/
OwnerRecord AddVersion(OwnerRecord record, CapsuleVersion version);

/*
  Drop a version and every tag membership it had, recomputing latest.
  Throws NotFound(version) when absent.
*/
OwnerRecord RemoveVersion(OwnerRecord record, const std::string& version_id);

// Throws CorruptIndex describing the first inconsistency found.
void CheckConsistency(const OwnerRecord& record, const std::string& expected_owner);

// created_at desc, then version_id desc. Optionally limited to one tag.
std::vector<CapsuleVersion> SortedNewestFirst(const OwnerRecord& record, const std::optional<std::string>& tag = std::nullopt);

OwnerSummary Summarize(const OwnerRecord& record);

} // namespace capsule::index
