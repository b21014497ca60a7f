#pragma once

#include <exception>
#include <string_view>

namespace capsule::util {

/*
  Flat error taxonomy for callers that cannot catch by type
  (CLI exit codes, log fields, metrics labels).
*/
enum class ErrorCode {
  kOk = 0,

  kValidationFailure,
  kOwnerNotFound,
  kVersionNotFound,
  kTagNotFound,
  kCorruptIndex,
  kIntegrityMismatch,
  kIOFailure,
  kPartialFailure,

  kInvalidArgument,
  kInternal,
};

ErrorCode Classify(const std::exception& e);

std::string_view ErrorCodeName(ErrorCode code);

int ExitCode(ErrorCode code);

} // namespace capsule::util
