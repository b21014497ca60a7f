#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace capsule::storage {

struct BlobInfo {
  std::string     owner;
  std::string     version_id;
  std::string     location;
  uint64_t        byte_size = 0;
  util::TimePoint modified_at;
};

/*
  Immutable blob storage, one container per owner.

  Every capsule is represented as an Arrow Buffer.
  Blobs are write-once: a committed blob is never replaced in place.

  Implementations:
    DISK     -> Arrow file IO, temp file + rename
    MEMORY   -> in-memory Arrow buffers

  All storage errors surface as util::IOFailure.
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Commit a new blob.

    Throws IOFailure if the blob already exists or the write fails. A
    half-written blob is never visible under its final name.
  */
  virtual void Write(const std::string& owner, const std::string& version_id, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read entire blob into an Arrow buffer.

    Throws NotFound(version) when the blob is absent.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& owner, const std::string& version_id) = 0;

  // ------------------------------------------------------------------
  // Delete
  // ------------------------------------------------------------------
  // Returns false when there was nothing to remove.
  virtual bool Remove(const std::string& owner, const std::string& version_id) = 0;

  // Drop the owner's container once it holds no blobs.
  virtual void RemoveOwner(const std::string& owner) = 0;

  // ------------------------------------------------------------------
  // Inspection
  // ------------------------------------------------------------------
  virtual bool Exists(const std::string& owner, const std::string& version_id) = 0;

  virtual std::optional<BlobInfo> Describe(const std::string& owner, const std::string& version_id) = 0;

  // Committed blobs only; temp files are skipped.
  virtual std::vector<BlobInfo> List(const std::string& owner) = 0;

  virtual std::vector<std::string> ListOwners() = 0;

  virtual std::string Location(const std::string& owner, const std::string& version_id) const = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace capsule::storage
