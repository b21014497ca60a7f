#include "internal/index/owner_index.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/index/disk/disk_owner_index.hpp"
#include "internal/index/memory/memory_owner_index.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace capsule::index;
using capsule::util::CorruptIndex;
using capsule::util::NotFound;
using capsule::util::NotFoundKind;

google::protobuf::Timestamp At(int64_t seconds) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds);
  return ts;
}

CapsuleVersion MakeVersion(const std::string& owner, const std::string& version_id, int64_t seconds) {
  CapsuleVersion version;
  version.set_owner(owner);
  version.set_version_id(version_id);
  *version.mutable_created_at() = At(seconds);
  *version.mutable_updated_at() = At(seconds);
  version.set_fingerprint(std::string(64, 'a'));
  version.set_byte_size(10);
  return version;
}

OwnerRecord ThreeVersions() {
  auto record = NewOwnerRecord("Nova", At(100));
  record      = AddVersion(std::move(record), MakeVersion("Nova", "v-b", 200));
  auto tagged = MakeVersion("Nova", "v-a", 300);
  tagged.add_tags("stable");
  tagged.add_tags("mirror-break");
  tagged.add_tags("stable");
  record = AddVersion(std::move(record), std::move(tagged));
  record = AddVersion(std::move(record), MakeVersion("Nova", "v-c", 150));
  return record;
}

void TestAddVersionTracksLatestAndTags() {
  auto record = ThreeVersions();
  assert(record.versions_size() == 3);
  assert(record.latest_version_id() == "v-a");

  const auto& tags = record.versions().at("v-a").tags();
  assert(tags.size() == 2);
  assert(tags.Get(0) == "mirror-break");
  assert(tags.Get(1) == "stable");
  assert(record.tag_index().at("stable").version_ids_size() == 1);

  CheckConsistency(record, "Nova");
}

void TestAddVersionRejectsDuplicatesAndForeignOwners() {
  auto record = ThreeVersions();

  bool threw = false;
  try {
    (void)AddVersion(record, MakeVersion("Nova", "v-a", 999));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)AddVersion(record, MakeVersion("Aurora", "v-z", 999));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestLatestTieBreaksOnVersionId() {
  auto record = NewOwnerRecord("Nova", At(1));
  record      = AddVersion(std::move(record), MakeVersion("Nova", "v-1", 50));
  record      = AddVersion(std::move(record), MakeVersion("Nova", "v-2", 50));
  assert(record.latest_version_id() == "v-2");
  assert(RecomputeLatest(record) == "v-2");
}

void TestRemoveVersionRecomputesLatestAndDropsEmptyTags() {
  auto record = RemoveVersion(ThreeVersions(), "v-a");
  assert(record.latest_version_id() == "v-b");
  assert(record.tag_index().empty());
  CheckConsistency(record, "Nova");

  record = RemoveVersion(std::move(record), "v-b");
  record = RemoveVersion(std::move(record), "v-c");
  assert(record.latest_version_id().empty());
  CheckConsistency(record, "Nova");

  bool threw = false;
  try {
    (void)RemoveVersion(record, "v-c");
  } catch (const NotFound& e) {
    threw = e.kind() == NotFoundKind::kVersion;
  }
  assert(threw);
}

void TestCheckConsistencyFindsDamage() {
  auto expect_corrupt = [](const OwnerRecord& record) {
    bool threw = false;
    try {
      CheckConsistency(record, "Nova");
    } catch (const CorruptIndex&) {
      threw = true;
    }
    assert(threw);
  };

  auto wrong_latest = ThreeVersions();
  wrong_latest.set_latest_version_id("v-b");
  expect_corrupt(wrong_latest);

  auto dangling_tag = ThreeVersions();
  (*dangling_tag.mutable_tag_index())["stable"].add_version_ids("v-zz");
  expect_corrupt(dangling_tag);

  auto bad_fingerprint = ThreeVersions();
  (*bad_fingerprint.mutable_versions())["v-b"].set_fingerprint("abc");
  expect_corrupt(bad_fingerprint);

  auto untracked_tag = ThreeVersions();
  (*untracked_tag.mutable_versions())["v-c"].add_tags("orphaned");
  expect_corrupt(untracked_tag);

  auto renamed = ThreeVersions();
  renamed.set_owner("Aurora");
  expect_corrupt(renamed);
}

void TestSortedNewestFirstAndSummary() {
  auto record = ThreeVersions();

  auto all = SortedNewestFirst(record);
  assert(all.size() == 3);
  assert(all[0].version_id() == "v-a");
  assert(all[1].version_id() == "v-b");
  assert(all[2].version_id() == "v-c");

  auto stable = SortedNewestFirst(record, std::string("stable"));
  assert(stable.size() == 1);
  assert(SortedNewestFirst(record, std::string("missing")).empty());

  auto summary = Summarize(record);
  assert(summary.version_count() == 3);
  assert(summary.total_bytes() == 30);
  assert(summary.latest_version_id() == "v-a");
  assert(summary.tag_counts().at("mirror-break") == 1);
  assert(summary.earliest_version_at().seconds() == 150);
  assert(summary.latest_version_at().seconds() == 300);
}

void TestPersistenceRoundTrip(OwnerIndex& index) {
  assert(!index.Load("Nova").has_value());

  auto record = ThreeVersions();
  index.Persist("Nova", record);
  index.Persist("Aurora", NewOwnerRecord("Aurora", At(5)));

  auto loaded = index.Load("Nova");
  assert(loaded.has_value());
  assert(loaded->format_version() == kFormatVersion);
  assert(loaded->latest_version_id() == "v-a");
  assert(loaded->versions().at("v-a").tags_size() == 2);

  auto owners = index.ListOwners();
  assert(owners.size() == 2);
  assert(owners[0] == "Aurora");
  assert(owners[1] == "Nova");

  index.Remove("Aurora");
  index.Remove("Aurora");
  assert(!index.Load("Aurora").has_value());
  assert(index.ListOwners().size() == 1);
}

void TestMemoryIndex() {
  MemoryOwnerIndex index;
  TestPersistenceRoundTrip(index);
}

void TestDiskIndex() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_owner_index";
  std::filesystem::remove_all(root);

  {
    // Synced writes: file, then the index directory after the rename.
    DiskOwnerIndex index(root, true);
    TestPersistenceRoundTrip(index);
  }

  // A fresh instance reads what the previous one wrote.
  DiskOwnerIndex reopened(root, false);
  auto           loaded = reopened.Load("Nova");
  assert(loaded.has_value());
  assert(loaded->versions_size() == 3);

  std::filesystem::remove_all(root);
}

void TestDiskIndexRejectsDamagedDocuments() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_owner_index_corrupt";
  std::filesystem::remove_all(root);

  DiskOwnerIndex index(root, false);
  {
    std::ofstream out(root / "index" / "Nova.idx");
    out << "{ this is not json";
  }

  bool threw = false;
  try {
    (void)index.Load("Nova");
  } catch (const CorruptIndex&) {
    threw = true;
  }
  assert(threw);

  // Parses, but the latest pointer is wrong.
  auto record = ThreeVersions();
  record.set_latest_version_id("v-c");
  index.Persist("Nova", record);

  threw = false;
  try {
    (void)index.Load("Nova");
  } catch (const CorruptIndex&) {
    threw = true;
  }
  assert(threw);

  {
    std::ofstream out(root / "index" / "Nova.idx");
    out << R"({"format_version": 1, "owner": "Nova", "surprise": true})";
  }
  threw = false;
  try {
    (void)index.Load("Nova");
  } catch (const CorruptIndex&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestAddVersionTracksLatestAndTags();
  TestAddVersionRejectsDuplicatesAndForeignOwners();
  TestLatestTieBreaksOnVersionId();
  TestRemoveVersionRecomputesLatestAndDropsEmptyTags();
  TestCheckConsistencyFindsDamage();
  TestSortedNewestFirstAndSummary();
  TestMemoryIndex();
  TestDiskIndex();
  TestDiskIndexRejectsDamagedDocuments();

  std::cout << "capsule_store_unit_owner_index: pass\n";
  return 0;
}
