#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace capsule::util {

/*
  Central error types.

  Every failure surfaced by the store is one of these. Library errors
  (Arrow, filesystem, protobuf) are translated at the layer that sees them.
*/

// Malformed or incomplete content. Raised before anything is written.
class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class NotFoundKind {
  kOwner,
  kVersion,
  kTag,
};

class NotFound : public std::runtime_error {
 public:
  NotFound(NotFoundKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  NotFoundKind kind() const {
    return kind_;
  }

 private:
  NotFoundKind kind_;
};

// The index references a version whose blob is gone, or the index document
// itself cannot be trusted. Never repaired on the read path.
class CorruptIndex : public std::runtime_error {
 public:
  explicit CorruptIndex(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IntegrityMismatch : public std::runtime_error {
 public:
  explicit IntegrityMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IOFailure : public std::runtime_error {
 public:
  explicit IOFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Blob committed, index not updated. The blob is an orphan until
// reconciliation re-indexes it.
class PartialFailure : public std::runtime_error {
 public:
  PartialFailure(std::string version_id, const std::string& msg) : std::runtime_error(msg), version_id_(std::move(version_id)) {
  }

  const std::string& version_id() const {
    return version_id_;
  }

 private:
  std::string version_id_;
};

const char* ToString(NotFoundKind kind);

} // namespace capsule::util
