#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/index/disk/disk_owner_index.hpp"
#include "internal/index/memory/memory_owner_index.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using capsule::config::ConfigLoader;
using capsule::factory::Build;
using capsule::factory::BuildSchemaValidator;

const char* kCapsule = R"({"metadata":{"instance_name":"Nova"},"traits":{},"personality":{},"memory":{},"environment":{}})";

bool RejectsOpaqueContent(const capsule::validation::SchemaValidatorPtr& validator) {
  try {
    (void)validator->Validate("Nova", *arrow::Buffer::FromString("opaque"));
  } catch (const capsule::util::ValidationFailure&) {
    return true;
  }
  return false;
}

void TestValidatorSelection() {
  assert(RejectsOpaqueContent(BuildSchemaValidator(ConfigLoader::LoadFromYamlString(""))));
  assert(!RejectsOpaqueContent(BuildSchemaValidator(ConfigLoader::LoadFromYamlString("validation:\n  enabled: false\n"))));
  assert(RejectsOpaqueContent(BuildSchemaValidator(ConfigLoader::LoadFromYamlString("validation:\n  enabled: true\n"))));
}

void TestRequiredSectionsWithoutEnabledStayEnforced() {
  auto validator = BuildSchemaValidator(ConfigLoader::LoadFromYamlString("validation:\n  required_sections: [metadata, ledger]\n"));
  assert(RejectsOpaqueContent(validator));

  // The configured list replaces the defaults.
  (void)validator->Validate("Nova", *arrow::Buffer::FromString(R"({"metadata":{},"ledger":{}})"));
  bool threw = false;
  try {
    (void)validator->Validate("Nova", *arrow::Buffer::FromString(kCapsule));
  } catch (const capsule::util::ValidationFailure&) {
    threw = true;
  }
  assert(threw);

  assert(RejectsOpaqueContent(BuildSchemaValidator(ConfigLoader::LoadFromYamlString("validation:\n  enforce_owner_match: true\n"))));
}

void TestFsyncDefaultsOn() {
  assert(capsule::factory::ResolveFsync(ConfigLoader::LoadFromYamlString("").storage()));
  assert(capsule::factory::ResolveFsync(ConfigLoader::LoadFromYamlString("storage:\n  root_path: /tmp/x\n").storage()));
  assert(capsule::factory::ResolveFsync(ConfigLoader::LoadFromYamlString("storage:\n  fsync: true\n").storage()));
  assert(!capsule::factory::ResolveFsync(ConfigLoader::LoadFromYamlString("storage:\n  fsync: false\n").storage()));
}

void TestRetryAttemptsDefault() {
  capsule::runtime::config::StorageConfig cfg;
  assert(capsule::factory::ResolveRetryAttempts(cfg) == capsule::factory::kDefaultIoRetryAttempts);
  cfg.set_io_retry_attempts(7);
  assert(capsule::factory::ResolveRetryAttempts(cfg) == 7);
}

void TestMemoryBackend() {
  auto app = Build(ConfigLoader::LoadFromYamlString("storage:\n  backend: STORAGE_BACKEND_MEMORY\n"));
  assert(std::dynamic_pointer_cast<capsule::storage::RamBlobStore>(app.blobs));
  assert(std::dynamic_pointer_cast<capsule::index::MemoryOwnerIndex>(app.index));

  auto version_id = app.store->Store("Nova", std::string(kCapsule));
  assert(app.store->Retrieve("Nova", capsule::core::Latest{}).metadata.version_id() == version_id);
}

void TestDiskBackendHydratesOnBuild() {
  const auto root = std::filesystem::temp_directory_path() / "capsule_store_factory";
  std::filesystem::remove_all(root);

  auto config = ConfigLoader::LoadFromYamlString("storage:\n  root_path: \"" + root.string() + "\"\n");

  std::string version_id;
  {
    auto app = Build(config);
    assert(std::dynamic_pointer_cast<capsule::storage::DiskBlobStore>(app.blobs));
    assert(std::dynamic_pointer_cast<capsule::index::DiskOwnerIndex>(app.index));
    version_id = app.store->Store("Nova", std::string(kCapsule));
  }

  auto app = Build(config);
  assert(app.store->ListOwners().size() == 1);
  assert(app.store->Summary("Nova").latest_version_id() == version_id);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestValidatorSelection();
  TestRequiredSectionsWithoutEnabledStayEnforced();
  TestFsyncDefaultsOn();
  TestRetryAttemptsDefault();
  TestMemoryBackend();
  TestDiskBackendHydratesOnBuild();

  std::cout << "capsule_store_unit_factory: pass\n";
  return 0;
}
