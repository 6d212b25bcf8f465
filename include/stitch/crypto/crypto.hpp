#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace stitch::crypto {

constexpr size_t SHA256_SIZE = 32;

using Sha256Digest = std::array<uint8_t, SHA256_SIZE>;

// Initialize the crypto subsystem
bool init();

// SHA-256 of a byte range
Sha256Digest sha256(std::span<const uint8_t> data);

// Lowercase hex encoding
std::string to_hex(std::span<const uint8_t> data);

}  // namespace stitch::crypto
