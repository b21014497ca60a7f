#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/storage/blob_store.hpp"
#include "internal/validation/schema_validator.hpp"

namespace capsule::storage {

struct WriteReceipt {
  std::string                       storage_location;
  std::string                       fingerprint;
  uint64_t                          byte_size = 0;
  validation::CapsuleDescriptor     descriptor;
};

/*
  Write-once capsule blobs.

  Content is validated and fingerprinted before anything reaches the
  backend; a rejected capsule leaves no trace in storage. Transient
  IOFailures are retried a bounded number of times.
*/
class CapsuleObjectStore {
 public:
  struct Options {
    bool     fsync             = true;
    uint32_t io_retry_attempts = 3;
  };

  CapsuleObjectStore(BlobStorePtr blobs, validation::SchemaValidatorPtr validator, Options options);

  // Throws ValidationFailure, or IOFailure if the blob exists or cannot be written.
  WriteReceipt Write(const std::string& owner, const std::shared_ptr<arrow::Buffer>& content, const std::string& version_id);

  // Throws NotFound(version) when the blob is absent.
  std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id);

  // Returns false when the blob was already gone.
  bool Delete(const std::string& owner, const std::string& version_id);

  validation::CapsuleDescriptor Validate(const std::string& owner, const arrow::Buffer& content) const;

  const BlobStorePtr& blobs() const {
    return blobs_;
  }

  const Options& options() const {
    return options_;
  }

 private:
  BlobStorePtr                   blobs_;
  validation::SchemaValidatorPtr validator_;
  Options                        options_;
};

} // namespace capsule::storage
