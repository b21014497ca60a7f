#include "error_codes.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace capsule::util {

const char* ToString(NotFoundKind kind) {
  switch (kind) {
    case NotFoundKind::kOwner:
      return "owner";
    case NotFoundKind::kVersion:
      return "version";
    case NotFoundKind::kTag:
      return "tag";
  }
  return "unknown";
}

ErrorCode Classify(const std::exception& e) {
  if (dynamic_cast<const ValidationFailure*>(&e)) {
    return ErrorCode::kValidationFailure;
  }
  if (const auto* not_found = dynamic_cast<const NotFound*>(&e)) {
    switch (not_found->kind()) {
      case NotFoundKind::kOwner:
        return ErrorCode::kOwnerNotFound;
      case NotFoundKind::kVersion:
        return ErrorCode::kVersionNotFound;
      case NotFoundKind::kTag:
        return ErrorCode::kTagNotFound;
    }
  }
  if (dynamic_cast<const CorruptIndex*>(&e)) {
    return ErrorCode::kCorruptIndex;
  }
  if (dynamic_cast<const IntegrityMismatch*>(&e)) {
    return ErrorCode::kIntegrityMismatch;
  }
  if (dynamic_cast<const IOFailure*>(&e)) {
    return ErrorCode::kIOFailure;
  }
  if (dynamic_cast<const PartialFailure*>(&e)) {
    return ErrorCode::kPartialFailure;
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return ErrorCode::kInvalidArgument;
  }

  return ErrorCode::kInternal;
}

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kValidationFailure:
      return "validation_failure";
    case ErrorCode::kOwnerNotFound:
      return "owner_not_found";
    case ErrorCode::kVersionNotFound:
      return "version_not_found";
    case ErrorCode::kTagNotFound:
      return "tag_not_found";
    case ErrorCode::kCorruptIndex:
      return "corrupt_index";
    case ErrorCode::kIntegrityMismatch:
      return "integrity_mismatch";
    case ErrorCode::kIOFailure:
      return "io_failure";
    case ErrorCode::kPartialFailure:
      return "partial_failure";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kInternal:
      return "internal";
  }
  return "internal";
}

int ExitCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return 0;
    case ErrorCode::kInvalidArgument:
      return 1;
    case ErrorCode::kValidationFailure:
      return 3;
    case ErrorCode::kOwnerNotFound:
    case ErrorCode::kVersionNotFound:
    case ErrorCode::kTagNotFound:
      return 4;
    case ErrorCode::kIntegrityMismatch:
      return 5;
    case ErrorCode::kCorruptIndex:
      return 6;
    case ErrorCode::kPartialFailure:
      return 7;
    case ErrorCode::kIOFailure:
      return 8;
    case ErrorCode::kInternal:
      return 2;
  }
  return 2;
}

} // namespace capsule::util
