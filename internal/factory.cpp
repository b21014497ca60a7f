#include "factory.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/index/disk/disk_owner_index.hpp"
#include "internal/index/memory/memory_owner_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"

namespace capsule::factory {

using capsule::runtime::config::RuntimeConfig;
using capsule::runtime::config::StorageConfig;

uint32_t ResolveRetryAttempts(const StorageConfig& cfg) {
  return cfg.io_retry_attempts() > 0 ? cfg.io_retry_attempts() : kDefaultIoRetryAttempts;
}

bool ResolveFsync(const StorageConfig& cfg) {
  return cfg.has_fsync() ? cfg.fsync() : true;
}

validation::SchemaValidatorPtr BuildSchemaValidator(const RuntimeConfig& config) {
  if (!config.has_validation()) {
    return std::make_shared<validation::StructuralSchemaValidator>();
  }

  const auto& validation_cfg = config.validation();
  if (validation_cfg.has_enabled() && !validation_cfg.enabled()) {
    CAPSULE_LOG_WARN("Structural capsule validation disabled",
                     {observability::IntField("ignored_required_sections", validation_cfg.required_sections_size())});
    return std::make_shared<validation::PassthroughSchemaValidator>();
  }

  std::vector<std::string> sections(validation_cfg.required_sections().begin(), validation_cfg.required_sections().end());
  if (sections.empty()) {
    sections = validation::StructuralSchemaValidator::DefaultRequiredSections();
  }
  return std::make_shared<validation::StructuralSchemaValidator>(std::move(sections), validation_cfg.enforce_owner_match());
}

index::OwnerIndexPtr BuildOwnerIndex(const StorageConfig& cfg) {
  if (cfg.backend() == capsule::runtime::config::STORAGE_BACKEND_MEMORY) {
    return std::make_shared<index::MemoryOwnerIndex>();
  }
  return std::make_shared<index::DiskOwnerIndex>(storage::StorageFactory::RootPath(cfg), ResolveFsync(cfg));
}

Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage backends
  // ------------------------------------------------------------------
  app.blobs = storage::StorageFactory::Build(config.storage());
  app.index = BuildOwnerIndex(config.storage());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto retry_attempts = ResolveRetryAttempts(config.storage());

  storage::CapsuleObjectStore::Options object_options;
  object_options.fsync             = ResolveFsync(config.storage());
  object_options.io_retry_attempts = retry_attempts;
  app.objects                      = std::make_shared<storage::CapsuleObjectStore>(app.blobs, BuildSchemaValidator(config), object_options);

  core::CapsuleStore::Options store_options;
  store_options.io_retry_attempts = retry_attempts;
  app.store                       = std::make_shared<core::CapsuleStore>(app.objects, app.index, store_options);
  app.store->Hydrate();

  CAPSULE_LOG_INFO("Capsule store ready",
                   {observability::StringField("root", storage::StorageFactory::RootPath(config.storage()).string()),
                    observability::StringField("backend", capsule::runtime::config::StorageBackend_Name(config.storage().backend())),
                    observability::BoolField("fsync", ResolveFsync(config.storage()))});
  return app;
}

} // namespace capsule::factory
