#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/capsule_store.hpp"
#include "internal/index/owner_index.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/storage/capsule_object_store.hpp"
#include "internal/validation/schema_validator.hpp"

namespace capsule::factory {

/*
  Application

  Owns every long-lived component behind the store.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  storage::BlobStorePtr                        blobs;
  index::OwnerIndexPtr                         index;
  std::shared_ptr<storage::CapsuleObjectStore> objects;
  std::shared_ptr<core::CapsuleStore>          store;
};

inline constexpr uint32_t kDefaultIoRetryAttempts = 3;

uint32_t ResolveRetryAttempts(const capsule::runtime::config::StorageConfig& cfg);

// Durable unless the config explicitly opts out.
bool ResolveFsync(const capsule::runtime::config::StorageConfig& cfg);

// Structural validation unless the config sets `enabled: false`. A section
// that only lists required_sections is enabled.
validation::SchemaValidatorPtr BuildSchemaValidator(const capsule::runtime::config::RuntimeConfig& config);

index::OwnerIndexPtr BuildOwnerIndex(const capsule::runtime::config::StorageConfig& cfg);

/*
  Build

  Composition root: the only place that knows the concrete backend types.
  The returned store is already hydrated.
*/
Application Build(const capsule::runtime::config::RuntimeConfig& config);

inline std::shared_ptr<core::CapsuleStore> BuildStore(const capsule::runtime::config::RuntimeConfig& config) {
  return Build(config).store;
}

} // namespace capsule::factory
