#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "capsule/store/v1.hpp"
#include "internal/storage/capsule_object_store.hpp"

namespace capsule::core {

struct Latest {};

struct ByVersionId {
  std::string version_id;
};

struct ByTag {
  std::string tag;
};

/*
  Version whose created_at is closest to latest.created_at + offset.
  Negative offsets look back in time.
*/
struct ByTimeOffset {
  std::chrono::seconds offset{0};
};

using Selector = std::variant<Latest, ByVersionId, ByTag, ByTimeOffset>;

std::string DescribeSelector(const Selector& selector);

struct RetrievalResult {
  std::shared_ptr<arrow::Buffer>          content;
  capsule::store::v1::CapsuleVersion      metadata;
  bool                                    integrity_valid = false;

  // Throws IntegrityMismatch when the fingerprint did not match.
  void RequireValid() const;
};

class RetrievalResolver {
 public:
  explicit RetrievalResolver(std::shared_ptr<storage::CapsuleObjectStore> objects);

  /*
    Map a selector onto one indexed version id.

    Tags with several members resolve to the newest member (greatest
    created_at, then greatest version_id). Throws NotFound with the kind
    matching the selector.
  */
  static std::string Resolve(const capsule::store::v1::OwnerRecord& record, const Selector& selector);

  /*
    Resolve, load and re-verify.

    A blob missing for an indexed version is reported as CorruptIndex. A
    fingerprint mismatch still returns the content, flagged invalid.
  */
  RetrievalResult Retrieve(const capsule::store::v1::OwnerRecord& record, const Selector& selector);

 private:
  std::shared_ptr<storage::CapsuleObjectStore> objects_;
};

} // namespace capsule::core
