#include "internal/storage/capsule_object_store.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/integrity/integrity_validator.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace capsule::storage;
using capsule::util::IOFailure;
using capsule::util::ValidationFailure;

const char* kCapsule = R"({"metadata":{"instance_name":"Nova","capsule_version":"3.0.0"},"traits":{},"personality":{},"memory":{},"environment":{}})";

// Fails the first `failures` writes with IOFailure, then delegates.
class FlakyBlobStore final : public BlobStore {
 public:
  explicit FlakyBlobStore(int failures) : failures_(failures) {
  }

  void Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override {
    ++write_calls;
    if (failures_ > 0) {
      --failures_;
      throw IOFailure("disk hiccup");
    }
    inner_.Write(owner, version_id, buffer, fsync);
  }

  std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id) override {
    return inner_.Read(owner, version_id);
  }

  bool Remove(const std::string& owner, const std::string& version_id) override {
    return inner_.Remove(owner, version_id);
  }

  void RemoveOwner(const std::string& owner) override {
    inner_.RemoveOwner(owner);
  }

  bool Exists(const std::string& owner, const std::string& version_id) override {
    return inner_.Exists(owner, version_id);
  }

  std::optional<BlobInfo> Describe(const std::string& owner, const std::string& version_id) override {
    return inner_.Describe(owner, version_id);
  }

  std::vector<BlobInfo> List(const std::string& owner) override {
    return inner_.List(owner);
  }

  std::vector<std::string> ListOwners() override {
    return inner_.ListOwners();
  }

  std::string Location(const std::string& owner, const std::string& version_id) const override {
    return inner_.Location(owner, version_id);
  }

  int write_calls = 0;

 private:
  int          failures_;
  RamBlobStore inner_;
};

std::shared_ptr<capsule::validation::SchemaValidator> Structural() {
  return std::make_shared<capsule::validation::StructuralSchemaValidator>();
}

void TestWriteReturnsReceipt() {
  auto               blobs = std::make_shared<RamBlobStore>();
  CapsuleObjectStore store(blobs, Structural(), {});

  auto content = arrow::Buffer::FromString(kCapsule);
  auto receipt = store.Write("Nova", content, "v-1");

  assert(receipt.fingerprint == capsule::integrity::IntegrityValidator::FingerprintHex(*content));
  assert(receipt.byte_size == static_cast<uint64_t>(content->size()));
  assert(receipt.storage_location == "memory://Nova/v-1");
  assert(receipt.descriptor.schema_version == "3.0.0");
  assert(store.Read("Nova", "v-1")->Equals(*content));
}

void TestRejectedCapsuleLeavesNoTrace() {
  auto               blobs = std::make_shared<RamBlobStore>();
  CapsuleObjectStore store(blobs, Structural(), {});

  bool threw = false;
  try {
    (void)store.Write("Nova", arrow::Buffer::FromString(R"({"metadata":{}})"), "v-1");
  } catch (const ValidationFailure&) {
    threw = true;
  }
  assert(threw);
  assert(!blobs->Exists("Nova", "v-1"));
  assert(blobs->ListOwners().empty());

  threw = false;
  try {
    (void)store.Write("Nova", nullptr, "v-1");
  } catch (const ValidationFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestTransientWriteFailureIsRetried() {
  auto               blobs = std::make_shared<FlakyBlobStore>(2);
  CapsuleObjectStore store(blobs, nullptr, {false, 3});

  (void)store.Write("Nova", arrow::Buffer::FromString("payload"), "v-1");
  assert(blobs->write_calls == 3);
  assert(blobs->Exists("Nova", "v-1"));
}

void TestPersistentWriteFailureSurfaces() {
  auto               blobs = std::make_shared<FlakyBlobStore>(10);
  CapsuleObjectStore store(blobs, nullptr, {false, 2});

  bool threw = false;
  try {
    (void)store.Write("Nova", arrow::Buffer::FromString("payload"), "v-1");
  } catch (const IOFailure&) {
    threw = true;
  }
  assert(threw);
  assert(blobs->write_calls == 2);
}

void TestDeleteReportsMissingBlob() {
  CapsuleObjectStore store(std::make_shared<RamBlobStore>(), nullptr, {});
  (void)store.Write("Nova", arrow::Buffer::FromString("payload"), "v-1");
  assert(store.Delete("Nova", "v-1"));
  assert(!store.Delete("Nova", "v-1"));
}

} // namespace

int main() {
  TestWriteReturnsReceipt();
  TestRejectedCapsuleLeavesNoTrace();
  TestTransientWriteFailureIsRetried();
  TestPersistentWriteFailureSurfaces();
  TestDeleteReportsMissingBlob();

  std::cout << "capsule_store_unit_capsule_object_store: pass\n";
  return 0;
}
