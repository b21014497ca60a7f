#include "capsule_store.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>
#include <type_traits>

#include "internal/index/tag_index.hpp"
#include "internal/integrity/integrity_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace capsule::core {

using capsule::store::v1::CapsuleVersion;
using capsule::store::v1::OwnerRecord;
using capsule::store::v1::OwnerSummary;
using capsule::store::v1::ReconciliationReport;
using observability::IntField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveOperation(std::string_view operation, const std::string& owner, Fn&& fn) {
  observability::SpanScope span(operation);
  span.SetAttribute("capsule.owner", owner);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    observability::Metrics::Instance().RecordOperation(operation, success);
    observability::Metrics::Instance().ObserveOperationLatencyMs(
        operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    finish(false);
    throw;
  }
}

std::uint64_t TotalBytes(const OwnerRecord& record) {
  std::uint64_t total = 0;
  for (const auto& [version_id, version] : record.versions()) {
    total += version.byte_size();
  }
  return total;
}

[[noreturn]] void OwnerNotFound(const std::string& owner) {
  throw util::NotFound(util::NotFoundKind::kOwner, "owner '" + owner + "' not found");
}

const OwnerRecord& RequireRecord(const std::optional<OwnerRecord>& record, const std::string& owner) {
  if (!record) OwnerNotFound(owner);
  return *record;
}

void RequireVersion(const OwnerRecord& record, const std::string& version_id) {
  if (record.versions().count(version_id) == 0) {
    throw util::NotFound(util::NotFoundKind::kVersion, "version '" + version_id + "' not found for owner '" + record.owner() + "'");
  }
}

} // namespace

CapsuleStore::CapsuleStore(std::shared_ptr<storage::CapsuleObjectStore> objects, index::OwnerIndexPtr index, Options options)
    : objects_(objects), index_(std::move(index)), resolver_(objects), options_(options) {
  if (!index_) {
    throw std::invalid_argument("CapsuleStore: owner index must not be null");
  }
}

std::shared_ptr<CapsuleStore::OwnerSlot> CapsuleStore::Slot(const std::string& owner) {
  storage::common::ValidateComponent("owner", owner);

  std::lock_guard<std::mutex> lock(slots_guard_);
  auto&                       slot = slots_[owner];
  if (!slot) {
    slot = std::make_shared<OwnerSlot>();
  }
  return slot;
}

void CapsuleStore::Release(const std::string& owner, std::shared_ptr<OwnerSlot>& slot) {
  std::lock_guard<std::mutex> lock(slots_guard_);
  auto                        it = slots_.find(owner);
  // Only the map and this caller hold it, so nobody else can be inside its mutex.
  if (it != slots_.end() && it->second == slot && slot.use_count() == 2 && !slot->record && !slot->diverged) {
    slots_.erase(it);
  }
  slot.reset();
}

CapsuleStore::SlotLease::SlotLease(CapsuleStore& store, const std::string& owner) : store_(store), owner_(owner), slot_(store.Slot(owner)) {
}

CapsuleStore::SlotLease::~SlotLease() {
  store_.Release(owner_, slot_);
}

std::size_t CapsuleStore::CachedOwnerCount() {
  std::lock_guard<std::mutex> lock(slots_guard_);
  return slots_.size();
}

void CapsuleStore::LoadLocked(OwnerSlot& slot, const std::string& owner) {
  if (slot.loaded) {
    return;
  }
  slot.record = util::RetryOnIOFailure(options_.io_retry_attempts, "index_load", [&] { return index_->Load(owner); });
  slot.loaded = true;
}

template <typename Fn>
auto CapsuleStore::WithRecord(const std::string& owner, Fn&& fn) {
  SlotLease slot(*this, owner);
  for (;;) {
    {
      std::shared_lock<std::shared_mutex> lock(slot->mutex);
      if (slot->loaded) {
        return fn(static_cast<const std::optional<OwnerRecord>&>(slot->record));
      }
    }
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);
  }
}

void CapsuleStore::PersistLocked(const std::string& owner, const OwnerRecord& record) {
  util::RetryOnIOFailure(options_.io_retry_attempts, "index_persist", [&] { index_->Persist(owner, record); });
}

std::size_t CapsuleStore::Hydrate() {
  const auto owners = util::RetryOnIOFailure(options_.io_retry_attempts, "index_list", [&] { return index_->ListOwners(); });

  std::size_t loaded = 0;
  for (const auto& owner : owners) {
    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    try {
      LoadLocked(*slot, owner);
    } catch (const util::CorruptIndex& e) {
      CAPSULE_LOG_ERROR("Owner index is corrupt", {StringField("owner", owner), StringField("error", e.what())});
      continue;
    }
    if (slot->record) {
      observability::Metrics::Instance().SetStoredBytes(owner, TotalBytes(*slot->record));
      ++loaded;
    }
  }

  CAPSULE_LOG_INFO("Capsule store hydrated", {IntField("owners", static_cast<std::int64_t>(loaded))});
  return loaded;
}

std::string CapsuleStore::Store(const std::string& owner, std::string content) {
  return Store(owner, arrow::Buffer::FromString(std::move(content)));
}

std::string CapsuleStore::Store(const std::string& owner, const std::shared_ptr<arrow::Buffer>& content) {
  return ObserveOperation("CapsuleStore.Store", owner, [&] {
    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);

    const auto  now    = util::ToProto(util::Now());
    OwnerRecord record = slot->record ? *slot->record : index::NewOwnerRecord(owner, now);

    std::string version_id = util::GenerateVersionId();
    while (record.versions().count(version_id) != 0) {
      version_id = util::GenerateVersionId();
    }

    // Validation and IO failures leave no trace in the index.
    const auto receipt = objects_->Write(owner, content, version_id);

    CapsuleVersion version;
    version.set_owner(owner);
    version.set_version_id(version_id);
    *version.mutable_created_at() =
        record.latest_version_id().empty() ? now : util::StrictlyAfter(now, record.versions().at(record.latest_version_id()).created_at());
    *version.mutable_updated_at() = version.created_at();
    version.set_fingerprint(receipt.fingerprint);
    version.set_storage_location(receipt.storage_location);
    version.set_byte_size(receipt.byte_size);
    version.set_schema_version(receipt.descriptor.schema_version);
    version.set_producer_id(receipt.descriptor.producer_id);
    version.set_source_tag(receipt.descriptor.source_tag);

    const auto created_at = version.created_at();
    record                = index::AddVersion(std::move(record), std::move(version));
    *record.mutable_updated_at() = created_at;

    try {
      PersistLocked(owner, record);
    } catch (const util::IOFailure& e) {
      CAPSULE_LOG_ERROR("Capsule committed but index persist failed",
                        {StringField("owner", owner), StringField("version_id", version_id), StringField("error", e.what())});
      throw util::PartialFailure(version_id, "capsule '" + version_id + "' of owner '" + owner + "' was written but not indexed: " + e.what());
    }

    slot->record   = std::move(record);
    slot->diverged = false;
    observability::Metrics::Instance().SetStoredBytes(owner, TotalBytes(*slot->record));

    CAPSULE_LOG_INFO("Capsule stored", {StringField("owner", owner), StringField("version_id", version_id),
                                        IntField("bytes", static_cast<std::int64_t>(receipt.byte_size)), StringField("fingerprint", receipt.fingerprint)});
    return version_id;
  });
}

RetrievalResult CapsuleStore::Retrieve(const std::string& owner, const Selector& selector) {
  return ObserveOperation("CapsuleStore.Retrieve", owner, [&] {
    auto result = WithRecord(owner, [&](const std::optional<OwnerRecord>& record) { return resolver_.Retrieve(RequireRecord(record, owner), selector); });

    if (!result.integrity_valid) {
      observability::Metrics::Instance().RecordIntegrityFailure(owner);
    }
    CAPSULE_LOG_DEBUG("Capsule retrieved", {StringField("owner", owner), StringField("selector", DescribeSelector(selector)),
                                            StringField("version_id", result.metadata.version_id()),
                                            observability::BoolField("integrity_valid", result.integrity_valid)});
    return result;
  });
}

void CapsuleStore::AddTag(const std::string& owner, const std::string& version_id, const std::string& tag) {
  ObserveOperation("CapsuleStore.AddTag", owner, [&] {
    index::ValidateTag(tag);

    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);

    const auto& current = RequireRecord(slot->record, owner);
    RequireVersion(current, version_id);

    const auto members = index::VersionsForTag(current, tag);
    if (std::binary_search(members.begin(), members.end(), version_id)) {
      return;
    }

    auto updated = index::AddTag(current, version_id, tag, util::ToProto(util::Now()));
    PersistLocked(owner, updated);
    slot->record   = std::move(updated);
    slot->diverged = false;

    CAPSULE_LOG_INFO("Capsule tagged", {StringField("owner", owner), StringField("version_id", version_id), StringField("tag", tag)});
  });
}

void CapsuleStore::RemoveTag(const std::string& owner, const std::string& version_id, const std::string& tag) {
  ObserveOperation("CapsuleStore.RemoveTag", owner, [&] {
    index::ValidateTag(tag);

    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);

    const auto& current = RequireRecord(slot->record, owner);
    RequireVersion(current, version_id);

    const auto members = index::VersionsForTag(current, tag);
    if (!std::binary_search(members.begin(), members.end(), version_id)) {
      return;
    }

    auto updated = index::RemoveTag(current, version_id, tag, util::ToProto(util::Now()));
    PersistLocked(owner, updated);
    slot->record   = std::move(updated);
    slot->diverged = false;

    CAPSULE_LOG_INFO("Capsule untagged", {StringField("owner", owner), StringField("version_id", version_id), StringField("tag", tag)});
  });
}

std::vector<CapsuleVersion> CapsuleStore::List(const std::string& owner, const std::optional<std::string>& tag) {
  return ObserveOperation("CapsuleStore.List", owner, [&] {
    return WithRecord(owner, [&](const std::optional<OwnerRecord>& record) {
      if (!record) {
        return std::vector<CapsuleVersion>{};
      }
      return index::SortedNewestFirst(*record, tag);
    });
  });
}

void CapsuleStore::Delete(const std::string& owner, const std::string& version_id) {
  ObserveOperation("CapsuleStore.Delete", owner, [&] {
    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);

    const auto& current = RequireRecord(slot->record, owner);
    RequireVersion(current, version_id);

    // Blob first. An IOFailure here aborts before the index is touched.
    if (!objects_->Delete(owner, version_id)) {
      CAPSULE_LOG_WARN("Deleting version whose blob was already missing", {StringField("owner", owner), StringField("version_id", version_id)});
    }

    auto updated                  = index::RemoveVersion(current, version_id);
    *updated.mutable_updated_at() = util::ToProto(util::Now());

    if (updated.versions().empty()) {
      slot->record.reset();
      slot->diverged = true;
      observability::Metrics::Instance().SetStoredBytes(owner, 0);
      try {
        util::RetryOnIOFailure(options_.io_retry_attempts, "index_remove", [&] { index_->Remove(owner); });
        slot->diverged = false;
      } catch (const util::IOFailure& e) {
        CAPSULE_LOG_ERROR("Blob removed but owner index could not be dropped",
                          {StringField("owner", owner), StringField("version_id", version_id), StringField("error", e.what())});
        throw util::PartialFailure(version_id, "version '" + version_id + "' of owner '" + owner + "' was removed but the index was not: " + e.what());
      }
      try {
        objects_->blobs()->RemoveOwner(owner);
      } catch (const util::IOFailure& e) {
        CAPSULE_LOG_WARN("Owner object container left in place", {StringField("owner", owner), StringField("error", e.what())});
      }
      CAPSULE_LOG_INFO("Last capsule deleted, owner removed", {StringField("owner", owner), StringField("version_id", version_id)});
      return;
    }

    // Readers must never see the removed version again, even if the persist fails.
    slot->record   = updated;
    slot->diverged = true;
    observability::Metrics::Instance().SetStoredBytes(owner, TotalBytes(updated));
    try {
      PersistLocked(owner, updated);
      slot->diverged = false;
    } catch (const util::IOFailure& e) {
      CAPSULE_LOG_ERROR("Blob removed but index persist failed",
                        {StringField("owner", owner), StringField("version_id", version_id), StringField("error", e.what())});
      throw util::PartialFailure(version_id, "version '" + version_id + "' of owner '" + owner + "' was removed but the index was not: " + e.what());
    }

    CAPSULE_LOG_INFO("Capsule deleted", {StringField("owner", owner), StringField("version_id", version_id),
                                         StringField("latest_version_id", updated.latest_version_id())});
  });
}

std::vector<std::string> CapsuleStore::ListOwners() {
  observability::SpanScope span("CapsuleStore.ListOwners");
  return util::RetryOnIOFailure(options_.io_retry_attempts, "index_list", [&] { return index_->ListOwners(); });
}

OwnerSummary CapsuleStore::Summary(const std::string& owner) {
  return ObserveOperation("CapsuleStore.Summary", owner, [&] {
    return WithRecord(owner, [&](const std::optional<OwnerRecord>& record) { return index::Summarize(RequireRecord(record, owner)); });
  });
}

bool CapsuleStore::Verify(const std::string& owner, const std::string& version_id) {
  return ObserveOperation("CapsuleStore.Verify", owner, [&] {
    const bool valid = WithRecord(owner, [&](const std::optional<OwnerRecord>& record) {
      return resolver_.Retrieve(RequireRecord(record, owner), ByVersionId{version_id}).integrity_valid;
    });
    if (!valid) {
      observability::Metrics::Instance().RecordIntegrityFailure(owner);
    }
    return valid;
  });
}

ReconciliationReport CapsuleStore::Reconcile(const std::string& owner, bool repair) {
  return ObserveOperation("CapsuleStore.Reconcile", owner, [&] {
    SlotLease                           slot(*this, owner);
    std::unique_lock<std::shared_mutex> lock(slot->mutex);
    LoadLocked(*slot, owner);

    ReconciliationReport report;
    report.set_owner(owner);

    auto blobs = util::RetryOnIOFailure(options_.io_retry_attempts, "blob_list", [&] { return objects_->blobs()->List(owner); });
    std::sort(blobs.begin(), blobs.end(), [](const storage::BlobInfo& a, const storage::BlobInfo& b) {
      return a.modified_at != b.modified_at ? a.modified_at < b.modified_at : a.version_id < b.version_id;
    });

    std::set<std::string> stored;
    for (const auto& blob : blobs) {
      stored.insert(blob.version_id);
      if (!slot->record || slot->record->versions().count(blob.version_id) == 0) {
        report.add_orphaned_blobs(blob.version_id);
      }
    }
    if (slot->record) {
      for (const auto& version : index::SortedNewestFirst(*slot->record)) {
        if (stored.count(version.version_id()) == 0) {
          report.add_dangling_versions(version.version_id());
        }
      }
    }

    if (report.orphaned_blobs().empty() && report.dangling_versions().empty()) {
      return report;
    }

    CAPSULE_LOG_WARN("Storage and index disagree", {StringField("owner", owner), IntField("orphaned_blobs", report.orphaned_blobs_size()),
                                                    IntField("dangling_versions", report.dangling_versions_size())});
    if (!repair) {
      return report;
    }

    const auto  now     = util::ToProto(util::Now());
    OwnerRecord updated = slot->record ? *slot->record : index::NewOwnerRecord(owner, now);

    for (const auto& version_id : report.dangling_versions()) {
      updated = index::RemoveVersion(std::move(updated), version_id);
      report.add_removed_versions(version_id);
    }

    for (const auto& blob : blobs) {
      if (updated.versions().count(blob.version_id) != 0) continue;

      auto                          content = objects_->Read(owner, blob.version_id);
      validation::CapsuleDescriptor descriptor;
      try {
        descriptor = objects_->Validate(owner, *content);
      } catch (const util::ValidationFailure& e) {
        CAPSULE_LOG_WARN("Orphaned blob failed validation and was not indexed",
                         {StringField("owner", owner), StringField("version_id", blob.version_id), StringField("error", e.what())});
        report.add_rejected_blobs(blob.version_id);
        continue;
      }

      CapsuleVersion version;
      version.set_owner(owner);
      version.set_version_id(blob.version_id);
      *version.mutable_created_at() = util::ToProto(blob.modified_at);
      *version.mutable_updated_at() = now;
      version.set_fingerprint(integrity::IntegrityValidator::FingerprintHex(*content));
      version.set_storage_location(blob.location);
      version.set_byte_size(static_cast<uint64_t>(content->size()));
      version.set_schema_version(descriptor.schema_version);
      version.set_producer_id(descriptor.producer_id);
      version.set_source_tag(descriptor.source_tag);

      updated = index::AddVersion(std::move(updated), std::move(version));
      report.add_reindexed_versions(blob.version_id);
    }
    *updated.mutable_updated_at() = now;

    if (updated.versions().empty()) {
      if (slot->record) {
        util::RetryOnIOFailure(options_.io_retry_attempts, "index_remove", [&] { index_->Remove(owner); });
        slot->record.reset();
      }
      slot->diverged = false;
      if (report.rejected_blobs().empty()) {
        objects_->blobs()->RemoveOwner(owner);
      }
    } else {
      PersistLocked(owner, updated);
      slot->record   = std::move(updated);
      slot->diverged = false;
    }
    observability::Metrics::Instance().SetStoredBytes(owner, slot->record ? TotalBytes(*slot->record) : 0);

    report.set_repaired(true);
    CAPSULE_LOG_WARN("Owner reconciled", {StringField("owner", owner), IntField("reindexed", report.reindexed_versions_size()),
                                          IntField("removed", report.removed_versions_size()), IntField("rejected", report.rejected_blobs_size())});
    return report;
  });
}

std::vector<ReconciliationReport> CapsuleStore::ReconcileAll(bool repair) {
  std::set<std::string> owners;
  for (auto& owner : ListOwners()) {
    owners.insert(std::move(owner));
  }
  for (auto& owner : util::RetryOnIOFailure(options_.io_retry_attempts, "blob_owners", [&] { return objects_->blobs()->ListOwners(); })) {
    owners.insert(std::move(owner));
  }

  std::vector<ReconciliationReport> reports;
  reports.reserve(owners.size());
  for (const auto& owner : owners) {
    try {
      reports.push_back(Reconcile(owner, repair));
    } catch (const util::CorruptIndex& e) {
      CAPSULE_LOG_ERROR("Owner skipped by reconciliation", {StringField("owner", owner), StringField("error", e.what())});
      ReconciliationReport report;
      report.set_owner(owner);
      report.set_error(e.what());
      reports.push_back(std::move(report));
    }
  }
  return reports;
}

} // namespace capsule::core
