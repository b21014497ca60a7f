#include "capsule_object_store.hpp"

#include <stdexcept>

#include "internal/integrity/integrity_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/retry.hpp"

namespace capsule::storage {

CapsuleObjectStore::CapsuleObjectStore(BlobStorePtr blobs, validation::SchemaValidatorPtr validator, Options options)
    : blobs_(std::move(blobs)), validator_(std::move(validator)), options_(options) {
  if (!blobs_) {
    throw std::invalid_argument("CapsuleObjectStore: blob store must not be null");
  }
  if (!validator_) {
    validator_ = std::make_shared<validation::PassthroughSchemaValidator>();
  }
}

validation::CapsuleDescriptor CapsuleObjectStore::Validate(const std::string& owner, const arrow::Buffer& content) const {
  return validator_->Validate(owner, content);
}

WriteReceipt CapsuleObjectStore::Write(const std::string& owner, const std::shared_ptr<arrow::Buffer>& content, const std::string& version_id) {
  common::ValidateComponent("owner", owner);
  common::ValidateComponent("version id", version_id);
  if (!content) {
    throw util::ValidationFailure("capsule content for owner '" + owner + "' is missing");
  }

  WriteReceipt receipt;
  receipt.descriptor  = Validate(owner, *content);
  receipt.fingerprint = integrity::IntegrityValidator::FingerprintHex(*content);
  receipt.byte_size   = static_cast<uint64_t>(content->size());

  util::RetryOnIOFailure(options_.io_retry_attempts, "blob_write", [&] { blobs_->Write(owner, version_id, content, options_.fsync); });

  receipt.storage_location = blobs_->Location(owner, version_id);

  CAPSULE_LOG_DEBUG("Committed capsule blob", {observability::StringField("owner", owner), observability::StringField("version_id", version_id),
                                               observability::IntField("bytes", static_cast<std::int64_t>(receipt.byte_size))});
  return receipt;
}

std::shared_ptr<arrow::Buffer> CapsuleObjectStore::Read(const std::string& owner, const std::string& version_id) {
  return util::RetryOnIOFailure(options_.io_retry_attempts, "blob_read", [&] { return blobs_->Read(owner, version_id); });
}

bool CapsuleObjectStore::Delete(const std::string& owner, const std::string& version_id) {
  return util::RetryOnIOFailure(options_.io_retry_attempts, "blob_remove", [&] { return blobs_->Remove(owner, version_id); });
}

} // namespace capsule::storage
