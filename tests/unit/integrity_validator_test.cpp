#include "internal/integrity/integrity_validator.hpp"

#include <arrow/buffer.h>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using capsule::integrity::IntegrityValidator;

void TestKnownDigests() {
  auto abc = arrow::Buffer::FromString("abc");
  assert(IntegrityValidator::FingerprintHex(*abc) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  auto empty = arrow::Buffer::FromString("");
  assert(IntegrityValidator::FingerprintHex(*empty) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestHexRoundTripAcceptsUpperCase() {
  const auto digest = IntegrityValidator::Compute(*arrow::Buffer::FromString("capsule"));
  const auto hex    = IntegrityValidator::ToHex(digest);
  assert(hex.size() == 64);

  std::string upper = hex;
  for (auto& c : upper) {
    if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
  }
  assert(IntegrityValidator::FromHex(upper) == digest);
}

void TestVerifyReturnsFalseOnMismatch() {
  auto content = arrow::Buffer::FromString(R"({"memory":{}})");
  auto hex     = IntegrityValidator::FingerprintHex(*content);
  assert(IntegrityValidator::Verify(content, hex));

  auto tampered = arrow::Buffer::FromString(R"({"memory":[]})");
  assert(!IntegrityValidator::Verify(tampered, hex));
}

void TestVerifyRejectsUnusableInput() {
  bool threw = false;
  try {
    (void)IntegrityValidator::Verify(nullptr, std::string(64, '0'));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)IntegrityValidator::Verify(arrow::Buffer::FromString("x"), "not-a-digest");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)IntegrityValidator::FromHex(std::string(63, 'a') + "g");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKnownDigests();
  TestHexRoundTripAcceptsUpperCase();
  TestVerifyReturnsFalseOnMismatch();
  TestVerifyRejectsUnusableInput();

  std::cout << "capsule_store_unit_integrity_validator: pass\n";
  return 0;
}
