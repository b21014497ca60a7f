#include "retrieval_resolver.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "internal/index/owner_index.hpp"
#include "internal/index/tag_index.hpp"
#include "internal/integrity/integrity_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace capsule::core {

using capsule::store::v1::CapsuleVersion;
using capsule::store::v1::OwnerRecord;

namespace {

std::string RequireLatest(const OwnerRecord& record) {
  if (record.latest_version_id().empty()) {
    throw util::NotFound(util::NotFoundKind::kVersion, "owner '" + record.owner() + "' has no versions");
  }
  return record.latest_version_id();
}

std::string ResolveTag(const OwnerRecord& record, const std::string& tag) {
  const auto members = index::VersionsForTag(record, tag);
  if (members.empty()) {
    throw util::NotFound(util::NotFoundKind::kTag, "tag '" + tag + "' not found for owner '" + record.owner() + "'");
  }

  const CapsuleVersion* chosen = nullptr;
  for (const auto& version_id : members) {
    auto it = record.versions().find(version_id);
    if (it == record.versions().end()) {
      throw util::CorruptIndex("tag '" + tag + "' references unknown version '" + version_id + "'");
    }
    if (chosen == nullptr || index::IsNewer(it->second, *chosen)) {
      chosen = &it->second;
    }
  }
  return chosen->version_id();
}

// reference + offset in microseconds, saturated at the int64 range.
int64_t OffsetTarget(int64_t reference_us, std::chrono::seconds offset) {
  constexpr int64_t kMax            = std::numeric_limits<int64_t>::max();
  constexpr int64_t kMin            = std::numeric_limits<int64_t>::min();
  constexpr int64_t kMaxOffsetSecs  = kMax / 1000000;
  const int64_t     offset_us       = std::clamp<int64_t>(offset.count(), -kMaxOffsetSecs, kMaxOffsetSecs) * 1000000;

  if (offset_us > 0 && reference_us > kMax - offset_us) return kMax;
  if (offset_us < 0 && reference_us < kMin - offset_us) return kMin;
  return reference_us + offset_us;
}

// |a - b| without signed overflow.
uint64_t Distance(int64_t a, int64_t b) {
  return a >= b ? static_cast<uint64_t>(a) - static_cast<uint64_t>(b) : static_cast<uint64_t>(b) - static_cast<uint64_t>(a);
}

std::string ResolveOffset(const OwnerRecord& record, std::chrono::seconds offset) {
  const auto&   latest = record.versions().at(RequireLatest(record));
  const int64_t target = OffsetTarget(util::ToUnixMicros(latest.created_at()), offset);

  const CapsuleVersion* chosen        = nullptr;
  uint64_t              chosen_delta  = 0;
  for (const auto& [version_id, version] : record.versions()) {
    const uint64_t delta = Distance(util::ToUnixMicros(version.created_at()), target);
    if (chosen == nullptr || delta < chosen_delta || (delta == chosen_delta && index::IsNewer(version, *chosen))) {
      chosen       = &version;
      chosen_delta = delta;
    }
  }
  return chosen->version_id();
}

} // namespace

std::string DescribeSelector(const Selector& selector) {
  return std::visit(
      [](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Latest>) {
          return "latest";
        } else if constexpr (std::is_same_v<T, ByVersionId>) {
          return "version:" + s.version_id;
        } else if constexpr (std::is_same_v<T, ByTag>) {
          return "tag:" + s.tag;
        } else {
          return "offset:" + std::to_string(s.offset.count()) + "s";
        }
      },
      selector);
}

void RetrievalResult::RequireValid() const {
  if (!integrity_valid) {
    throw util::IntegrityMismatch("fingerprint mismatch for version '" + metadata.version_id() + "' of owner '" + metadata.owner() + "'");
  }
}

RetrievalResolver::RetrievalResolver(std::shared_ptr<storage::CapsuleObjectStore> objects) : objects_(std::move(objects)) {
  if (!objects_) {
    throw std::invalid_argument("RetrievalResolver: object store must not be null");
  }
}

std::string RetrievalResolver::Resolve(const OwnerRecord& record, const Selector& selector) {
  return std::visit(
      [&record](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Latest>) {
          return RequireLatest(record);
        } else if constexpr (std::is_same_v<T, ByVersionId>) {
          if (record.versions().count(s.version_id) == 0) {
            throw util::NotFound(util::NotFoundKind::kVersion, "version '" + s.version_id + "' not found for owner '" + record.owner() + "'");
          }
          return s.version_id;
        } else if constexpr (std::is_same_v<T, ByTag>) {
          return ResolveTag(record, s.tag);
        } else {
          return ResolveOffset(record, s.offset);
        }
      },
      selector);
}

RetrievalResult RetrievalResolver::Retrieve(const OwnerRecord& record, const Selector& selector) {
  const auto version_id = Resolve(record, selector);

  RetrievalResult result;
  result.metadata = record.versions().at(version_id);

  try {
    result.content = objects_->Read(record.owner(), version_id);
  } catch (const util::NotFound&) {
    CAPSULE_LOG_ERROR("Indexed capsule blob is missing",
                      {observability::StringField("owner", record.owner()), observability::StringField("version_id", version_id)});
    throw util::CorruptIndex("index references version '" + version_id + "' of owner '" + record.owner() + "' but its blob is missing");
  }

  try {
    result.integrity_valid = integrity::IntegrityValidator::Verify(result.content, result.metadata.fingerprint());
  } catch (const std::invalid_argument& e) {
    throw util::CorruptIndex("stored fingerprint for version '" + version_id + "' is unusable: " + e.what());
  }

  if (!result.integrity_valid) {
    CAPSULE_LOG_WARN("Capsule fingerprint mismatch",
                     {observability::StringField("owner", record.owner()), observability::StringField("version_id", version_id),
                      observability::StringField("expected", result.metadata.fingerprint())});
  }
  return result;
}

} // namespace capsule::core
