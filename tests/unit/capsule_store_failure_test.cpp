#include "internal/core/capsule_store.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/index/memory/memory_owner_index.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace capsule::core;
using capsule::index::MemoryOwnerIndex;
using capsule::index::OwnerIndex;
using capsule::index::OwnerRecord;
using capsule::storage::BlobInfo;
using capsule::storage::BlobStore;
using capsule::storage::CapsuleObjectStore;
using capsule::storage::RamBlobStore;
using capsule::util::CorruptIndex;
using capsule::util::IOFailure;
using capsule::util::PartialFailure;

std::string Capsule(const std::string& memory) {
  return R"({"metadata":{"instance_name":"Nova"},"traits":{},"personality":{},"memory":{"note":")" + memory + R"("},"environment":{}})";
}

class FaultyOwnerIndex final : public OwnerIndex {
 public:
  std::optional<OwnerRecord> Load(const std::string& owner) override {
    if (owner == corrupt_owner) {
      throw CorruptIndex("index for owner '" + owner + "' is malformed");
    }
    return inner_.Load(owner);
  }

  void Persist(const std::string& owner, const OwnerRecord& record) override {
    ++persist_calls;
    if (fail_persist) {
      throw IOFailure("index volume unavailable");
    }
    inner_.Persist(owner, record);
  }

  void Remove(const std::string& owner) override {
    if (fail_remove) {
      throw IOFailure("index volume unavailable");
    }
    inner_.Remove(owner);
  }

  std::vector<std::string> ListOwners() override {
    auto owners = inner_.ListOwners();
    if (!corrupt_owner.empty()) owners.push_back(corrupt_owner);
    return owners;
  }

  bool        fail_persist  = false;
  bool        fail_remove   = false;
  int         persist_calls = 0;
  std::string corrupt_owner;

 private:
  MemoryOwnerIndex inner_;
};

class FaultyBlobStore final : public BlobStore {
 public:
  void Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override {
    inner.Write(owner, version_id, buffer, fsync);
  }

  std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id) override {
    return inner.Read(owner, version_id);
  }

  bool Remove(const std::string& owner, const std::string& version_id) override {
    if (fail_remove) {
      throw IOFailure("blob volume unavailable");
    }
    return inner.Remove(owner, version_id);
  }

  void RemoveOwner(const std::string& owner) override {
    inner.RemoveOwner(owner);
  }

  bool Exists(const std::string& owner, const std::string& version_id) override {
    return inner.Exists(owner, version_id);
  }

  std::optional<BlobInfo> Describe(const std::string& owner, const std::string& version_id) override {
    return inner.Describe(owner, version_id);
  }

  std::vector<BlobInfo> List(const std::string& owner) override {
    return inner.List(owner);
  }

  std::vector<std::string> ListOwners() override {
    return inner.ListOwners();
  }

  std::string Location(const std::string& owner, const std::string& version_id) const override {
    return inner.Location(owner, version_id);
  }

  bool         fail_remove = false;
  RamBlobStore inner;
};

struct Harness {
  std::shared_ptr<FaultyBlobStore>    blobs = std::make_shared<FaultyBlobStore>();
  std::shared_ptr<FaultyOwnerIndex>   index = std::make_shared<FaultyOwnerIndex>();
  std::shared_ptr<CapsuleObjectStore> objects =
      std::make_shared<CapsuleObjectStore>(blobs, std::make_shared<capsule::validation::StructuralSchemaValidator>(), CapsuleObjectStore::Options{false, 2});
  std::shared_ptr<CapsuleStore> store = std::make_shared<CapsuleStore>(objects, index, CapsuleStore::Options{2});
};

void TestPersistFailureOnStoreLeavesOrphanForReconcile() {
  Harness h;
  h.index->fail_persist = true;

  std::string orphan;
  bool        threw = false;
  try {
    (void)h.store->Store("Nova", Capsule("one"));
  } catch (const PartialFailure& e) {
    threw  = true;
    orphan = e.version_id();
  }
  assert(threw);
  assert(h.index->persist_calls == 2);
  assert(h.blobs->Exists("Nova", orphan));
  assert(h.store->List("Nova").empty());

  h.index->fail_persist = false;

  auto report = h.store->Reconcile("Nova", false);
  assert(report.orphaned_blobs_size() == 1);
  assert(report.orphaned_blobs(0) == orphan);
  assert(!report.repaired());
  assert(h.store->List("Nova").empty());

  report = h.store->Reconcile("Nova", true);
  assert(report.repaired());
  assert(report.reindexed_versions_size() == 1);

  auto versions = h.store->List("Nova");
  assert(versions.size() == 1);
  assert(versions[0].version_id() == orphan);
  assert(h.store->Retrieve("Nova", Latest{}).integrity_valid);

  // Nothing left to repair.
  report = h.store->Reconcile("Nova", true);
  assert(report.orphaned_blobs().empty());
  assert(report.dangling_versions().empty());
  assert(!report.repaired());
}

void TestBlobRemoveFailureAbortsDeleteBeforeIndex() {
  Harness h;
  auto    v1 = h.store->Store("Nova", Capsule("one"));
  auto    v2 = h.store->Store("Nova", Capsule("two"));

  h.blobs->fail_remove = true;
  const int persisted  = h.index->persist_calls;

  bool threw = false;
  try {
    h.store->Delete("Nova", v2);
  } catch (const IOFailure&) {
    threw = true;
  }
  assert(threw);
  assert(h.index->persist_calls == persisted);
  assert(h.store->List("Nova").size() == 2);
  assert(h.store->Retrieve("Nova", Latest{}).metadata.version_id() == v2);

  h.blobs->fail_remove = false;
  h.store->Delete("Nova", v2);
  assert(h.store->Retrieve("Nova", Latest{}).metadata.version_id() == v1);
}

void TestPersistFailureOnDeleteHidesVersion() {
  Harness h;
  auto    v1 = h.store->Store("Nova", Capsule("one"));
  auto    v2 = h.store->Store("Nova", Capsule("two"));

  h.index->fail_persist = true;
  bool threw            = false;
  try {
    h.store->Delete("Nova", v2);
  } catch (const PartialFailure& e) {
    threw = e.version_id() == v2;
  }
  assert(threw);
  assert(!h.blobs->Exists("Nova", v2));
  assert(h.store->List("Nova").size() == 1);
  assert(h.store->Retrieve("Nova", Latest{}).metadata.version_id() == v1);

  // The durable index still lists v2; reconciliation drops the dangling entry.
  h.index->fail_persist = false;
  auto durable          = h.index->Load("Nova");
  assert(durable->versions().count(v2) == 1);
}

void TestIndexRemoveFailureKeepsDeletedOwnerHidden() {
  Harness h;
  auto    v1 = h.store->Store("Nova", Capsule("one"));

  h.index->fail_remove = true;
  bool threw           = false;
  try {
    h.store->Delete("Nova", v1);
  } catch (const PartialFailure& e) {
    threw = e.version_id() == v1;
  }
  assert(threw);

  // The durable document survives, but the in-memory view must not reload it.
  assert(h.index->Load("Nova").has_value());
  assert(h.store->List("Nova").empty());
  assert(h.store->CachedOwnerCount() == 1);

  h.index->fail_remove = false;
  auto v2              = h.store->Store("Nova", Capsule("two"));
  assert(h.store->List("Nova").size() == 1);
  h.store->Delete("Nova", v2);
  assert(!h.index->Load("Nova").has_value());
  assert(h.store->CachedOwnerCount() == 0);
}

void TestMissingBlobIsCorruptIndexUntilRepaired() {
  Harness h;
  auto    v1 = h.store->Store("Nova", Capsule("one"));
  auto    v2 = h.store->Store("Nova", Capsule("two"));
  h.store->AddTag("Nova", v2, "stable");
  assert(h.blobs->inner.Remove("Nova", v2));

  bool threw = false;
  try {
    (void)h.store->Retrieve("Nova", Latest{});
  } catch (const CorruptIndex&) {
    threw = true;
  }
  assert(threw);

  // Read path never repairs.
  assert(h.store->List("Nova").size() == 2);

  auto report = h.store->Reconcile("Nova", true);
  assert(report.dangling_versions_size() == 1);
  assert(report.removed_versions(0) == v2);

  assert(h.store->Retrieve("Nova", Latest{}).metadata.version_id() == v1);
  assert(h.store->Summary("Nova").tag_counts().empty());
}

void TestInvalidOrphanIsRejectedNotIndexed() {
  Harness h;
  h.blobs->inner.Write("Nova", "stray", arrow::Buffer::FromString("not a capsule"), false);

  auto report = h.store->Reconcile("Nova", true);
  assert(report.orphaned_blobs_size() == 1);
  assert(report.rejected_blobs_size() == 1);
  assert(report.reindexed_versions().empty());
  assert(h.store->List("Nova").empty());
  assert(h.blobs->Exists("Nova", "stray"));
}

void TestReconcileAllReportsCorruptOwners() {
  Harness h;
  (void)h.store->Store("Nova", Capsule("one"));
  h.index->corrupt_owner = "Broken";

  assert(h.store->Hydrate() == 1);

  auto reports = h.store->ReconcileAll(true);
  assert(reports.size() == 2);
  assert(reports[0].owner() == "Broken");
  assert(!reports[0].error().empty());
  assert(reports[1].owner() == "Nova");
  assert(reports[1].error().empty());
  assert(!reports[1].repaired());
}

} // namespace

int main() {
  TestPersistFailureOnStoreLeavesOrphanForReconcile();
  TestBlobRemoveFailureAbortsDeleteBeforeIndex();
  TestPersistFailureOnDeleteHidesVersion();
  TestIndexRemoveFailureKeepsDeletedOwnerHidden();
  TestMissingBlobIsCorruptIndexUntilRepaired();
  TestInvalidOrphanIsRejectedNotIndexed();
  TestReconcileAllReportsCorruptOwners();

  std::cout << "capsule_store_unit_capsule_store_failure: pass\n";
  return 0;
}
