#include "integrity_validator.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace capsule::integrity {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

Fingerprint IntegrityValidator::Compute(const uint8_t* data, std::size_t size) {
  Fingerprint out{};

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx, data, size) != 1 ||
      EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
  }

  EVP_MD_CTX_free(ctx);
  if (out_len != out.size()) {
    throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
  }
  return out;
}

Fingerprint IntegrityValidator::Compute(const arrow::Buffer& content) {
  return Compute(content.data(), static_cast<std::size_t>(content.size()));
}

std::string IntegrityValidator::ToHex(const Fingerprint& fingerprint) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(fingerprint.size() * 2);
  for (const auto b : fingerprint) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

Fingerprint IntegrityValidator::FromHex(std::string_view hex) {
  Fingerprint out{};
  if (hex.size() != out.size() * 2) {
    throw std::invalid_argument("fingerprint must be 64 hex characters, got " + std::to_string(hex.size()));
  }

  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("fingerprint contains a non-hex character");
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

bool IntegrityValidator::Verify(const std::shared_ptr<arrow::Buffer>& content, std::string_view expected_hex) {
  if (!content) {
    throw std::invalid_argument("verify: content is unreadable (null buffer)");
  }

  const auto expected = FromHex(expected_hex);
  const auto actual   = Compute(*content);
  return CRYPTO_memcmp(expected.data(), actual.data(), actual.size()) == 0;
}

} // namespace capsule::integrity
