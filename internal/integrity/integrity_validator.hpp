#pragma once

#include <arrow/buffer.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace capsule::integrity {

/*
  Content fingerprinting.

  SHA-256 over the exact stored bytes. Tags and other index metadata are
  never part of the fingerprinted content.
*/

using Fingerprint = std::array<uint8_t, 32>;

class IntegrityValidator {
 public:
  static Fingerprint Compute(const uint8_t* data, std::size_t size);
  static Fingerprint Compute(const arrow::Buffer& content);

  // Lower-case hex, 64 characters.
  static std::string ToHex(const Fingerprint& fingerprint);

  // Throws std::invalid_argument unless `hex` is 64 hex characters.
  static Fingerprint FromHex(std::string_view hex);

  static std::string FingerprintHex(const arrow::Buffer& content) {
    return ToHex(Compute(content));
  }

  /*
    Recompute and compare.

    Returns false on mismatch. Throws std::invalid_argument only when the
    input itself is unusable (null content, malformed expected digest).
  */
  static bool Verify(const std::shared_ptr<arrow::Buffer>& content, std::string_view expected_hex);
};

} // namespace capsule::integrity
