#include <arrow/buffer.h>

#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using capsule::storage::BlobStore;
using capsule::storage::DiskBlobStore;
using capsule::storage::RamBlobStore;
using capsule::util::IOFailure;
using capsule::util::NotFound;

std::shared_ptr<arrow::Buffer> Bytes(const std::string& s) {
  return arrow::Buffer::FromString(s);
}

// Behaviour every backend must share.
void ExerciseBackend(BlobStore& store) {
  assert(store.List("Nova").empty());
  assert(store.ListOwners().empty());
  assert(!store.Exists("Nova", "v-1"));
  assert(!store.Describe("Nova", "v-1").has_value());

  store.Write("Nova", "v-2", Bytes("second"), false);
  store.Write("Nova", "v-1", Bytes("first!"), false);
  store.Write("Aurora", "v-1", Bytes("other owner"), false);

  assert(store.Read("Nova", "v-1")->ToString() == "first!");
  assert(store.Read("Aurora", "v-1")->ToString() == "other owner");
  assert(store.Exists("Nova", "v-2"));

  auto info = store.Describe("Nova", "v-2");
  assert(info.has_value());
  assert(info->byte_size == 6);
  assert(info->location == store.Location("Nova", "v-2"));

  auto listed = store.List("Nova");
  assert(listed.size() == 2);
  assert(listed[0].version_id == "v-1");
  assert(listed[1].version_id == "v-2");

  auto owners = store.ListOwners();
  assert(owners.size() == 2);
  assert(owners[0] == "Aurora");

  // Write-once.
  bool threw = false;
  try {
    store.Write("Nova", "v-1", Bytes("replacement"), false);
  } catch (const IOFailure&) {
    threw = true;
  }
  assert(threw);
  assert(store.Read("Nova", "v-1")->ToString() == "first!");

  threw = false;
  try {
    (void)store.Read("Nova", "v-404");
  } catch (const NotFound& e) {
    threw = e.kind() == capsule::util::NotFoundKind::kVersion;
  }
  assert(threw);

  // The container only goes once it is empty.
  threw = false;
  try {
    store.RemoveOwner("Nova");
  } catch (const IOFailure&) {
    threw = true;
  }
  assert(threw);

  assert(store.Remove("Nova", "v-1"));
  assert(!store.Remove("Nova", "v-1"));
  assert(store.Remove("Nova", "v-2"));
  store.RemoveOwner("Nova");
  store.RemoveOwner("Nova");

  owners = store.ListOwners();
  assert(owners.size() == 1);
  assert(owners[0] == "Aurora");
}

void TestRamBlobStore() {
  RamBlobStore store;
  ExerciseBackend(store);
  assert(store.Location("Nova", "v-1") == "memory://Nova/v-1");
}

void TestRamBlobStoreCopiesOnWrite() {
  RamBlobStore store;

  auto mutable_buffer = arrow::AllocateBuffer(4).ValueOrDie();
  std::memcpy(mutable_buffer->mutable_data(), "abcd", 4);
  std::shared_ptr<arrow::Buffer> shared(std::move(mutable_buffer));

  store.Write("Nova", "v-1", shared, false);
  std::memcpy(shared->mutable_data(), "zzzz", 4);

  assert(store.Read("Nova", "v-1")->ToString() == "abcd");
}

void TestDiskBlobStore() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_blob_store";
  std::filesystem::remove_all(root);

  DiskBlobStore store(root);
  ExerciseBackend(store);
  assert(std::filesystem::exists(root / "objects" / "Aurora" / "v-1"));

  std::filesystem::remove_all(root);
}

void TestDiskBlobStoreIgnoresTempFiles() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_blob_store_tmp";
  std::filesystem::remove_all(root);

  DiskBlobStore store(root);
  store.Write("Nova", "v-1", Bytes("committed"), true);

  // Debris from an interrupted write.
  {
    std::ofstream out(root / "objects" / "Nova" / "v-2.tmp");
    out << "half";
  }

  auto listed = store.List("Nova");
  assert(listed.size() == 1);
  assert(listed[0].version_id == "v-1");
  assert(!store.Exists("Nova", "v-2"));

  assert(store.Remove("Nova", "v-1"));
  store.RemoveOwner("Nova");
  assert(!std::filesystem::exists(root / "objects" / "Nova"));

  std::filesystem::remove_all(root);
}

void TestDiskBlobStoreRejectsUnsafeNames() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_blob_store_names";
  std::filesystem::remove_all(root);

  DiskBlobStore store(root);
  for (const std::string bad : {"", "..", "../escape", "a/b"}) {
    bool threw = false;
    try {
      store.Write(bad, "v-1", Bytes("x"), false);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestRamBlobStore();
  TestRamBlobStoreCopiesOnWrite();
  TestDiskBlobStore();
  TestDiskBlobStoreIgnoresTempFiles();
  TestDiskBlobStoreRejectsUnsafeNames();

  std::cout << "capsule_store_unit_blob_store: pass\n";
  return 0;
}
