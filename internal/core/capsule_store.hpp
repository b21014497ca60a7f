#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "capsule/store/v1.hpp"
#include "internal/core/retrieval_resolver.hpp"
#include "internal/index/owner_index.hpp"
#include "internal/storage/capsule_object_store.hpp"

namespace capsule::core {

/*
  Public operation surface of the capsule store.

  Each owner's record is held in memory behind its own reader/writer lock.
  Mutations for one owner are serialized; different owners never contend.
  The persisted index is the durable source of truth and is loaded lazily
  (or eagerly through Hydrate).
*/
class CapsuleStore {
 public:
  struct Options {
    uint32_t io_retry_attempts = 3;
  };

  CapsuleStore(std::shared_ptr<storage::CapsuleObjectStore> objects, index::OwnerIndexPtr index, Options options);

  // Loads every persisted owner. Corrupt documents are logged and left for
  // the next access to report. Returns the number of owners loaded.
  std::size_t Hydrate();

  std::string Store(const std::string& owner, const std::shared_ptr<arrow::Buffer>& content);
  std::string Store(const std::string& owner, std::string content);

  RetrievalResult Retrieve(const std::string& owner, const Selector& selector);

  void AddTag(const std::string& owner, const std::string& version_id, const std::string& tag);
  void RemoveTag(const std::string& owner, const std::string& version_id, const std::string& tag);

  // Newest first. Unknown owners yield an empty list.
  std::vector<capsule::store::v1::CapsuleVersion> List(const std::string& owner, const std::optional<std::string>& tag = std::nullopt);

  void Delete(const std::string& owner, const std::string& version_id);

  std::vector<std::string> ListOwners();

  capsule::store::v1::OwnerSummary Summary(const std::string& owner);

  // Re-read one blob and check its fingerprint.
  bool Verify(const std::string& owner, const std::string& version_id);

  /*
    Diff storage against the index for one owner.

    Without `repair` nothing is changed. With it, dangling entries are
    dropped and orphaned blobs that pass validation are indexed.
  */
  capsule::store::v1::ReconciliationReport Reconcile(const std::string& owner, bool repair);

  std::vector<capsule::store::v1::ReconciliationReport> ReconcileAll(bool repair);

  // Owners currently held in memory.
  std::size_t CachedOwnerCount();

 private:
  struct OwnerSlot {
    std::shared_mutex                                mutex;
    bool                                             loaded = false;
    std::optional<capsule::store::v1::OwnerRecord>   record;
    // Memory deliberately differs from the durable index (failed persist).
    bool                                             diverged = false;
  };

  /*
    Keeps an owner's slot referenced for the duration of one operation.

    On release a slot with no record and no other holder is dropped from the
    map, so names that never resolve to an owner are not retained. Declare it
    before any lock on the slot's mutex.
  */
  class SlotLease {
   public:
    SlotLease(CapsuleStore& store, const std::string& owner);
    ~SlotLease();

    SlotLease(const SlotLease&)            = delete;
    SlotLease& operator=(const SlotLease&) = delete;

    OwnerSlot* operator->() const { return slot_.get(); }
    OwnerSlot& operator*() const { return *slot_; }

   private:
    CapsuleStore&              store_;
    const std::string&         owner_;
    std::shared_ptr<OwnerSlot> slot_;
  };

  std::shared_ptr<OwnerSlot> Slot(const std::string& owner);
  void                       Release(const std::string& owner, std::shared_ptr<OwnerSlot>& slot);

  // Requires the slot's exclusive lock.
  void LoadLocked(OwnerSlot& slot, const std::string& owner);

  template <typename Fn>
  auto WithRecord(const std::string& owner, Fn&& fn);

  void PersistLocked(const std::string& owner, const capsule::store::v1::OwnerRecord& record);

  std::shared_ptr<storage::CapsuleObjectStore> objects_;
  index::OwnerIndexPtr                         index_;
  RetrievalResolver                            resolver_;
  Options                                      options_;

  std::mutex                                                  slots_guard_;
  std::unordered_map<std::string, std::shared_ptr<OwnerSlot>> slots_;
};

} // namespace capsule::core
