#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace landledger::core {
  using Hash256 = std::array<uint8_t, 32>;

  auto sha256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto toHex(std::span<const uint8_t> data) -> std::string;
  inline std::string to_hex(std::span<const uint8_t> data) { return toHex(data); }

  // Lowercase hex SHA-256 of a string; the digest used for block hashes,
  // proofs and certificate file fingerprints.
  inline std::string sha256_hex(const std::string& data) {
    auto digest = sha256(data);
    return to_hex(std::span<const uint8_t>(digest.data(), digest.size()));
  }

  // Hex encoding of `num_bytes` bytes from OpenSSL's CSPRNG.
  std::string random_hex(size_t num_bytes);
}
