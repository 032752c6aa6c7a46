#pragma once
#include "vid.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vid::kdf {

// SHA-256 via OpenSSL EVP. Throws std::runtime_error on failure.
std::array<uint8_t, 32> sha256(const uint8_t* data, size_t len);

// Raw secret string -> 32-byte HMAC key: SHA-256 over its UTF-8 bytes.
Secret derive_key(std::string_view raw_secret);

// First two SHA-256 digest bytes, big-endian. Stable across restarts.
uint16_t hash_to_u16(std::string_view text);

} // namespace vid::kdf
