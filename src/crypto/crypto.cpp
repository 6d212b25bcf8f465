#include "stitch/crypto/crypto.hpp"

#include <sodium.h>

namespace stitch::crypto {

bool init() {
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

Sha256Digest sha256(std::span<const uint8_t> data) {
    Sha256Digest digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::string to_hex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

}  // namespace stitch::crypto
