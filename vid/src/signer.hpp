#pragma once
#include "vid.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// HMAC-SHA256 over the 11-byte payload, truncated to the first 7 digest bytes.
//
// 7 bytes is what remains of the fixed 18-byte budget after the payload.
// That is a 2^56 forgery space: adequate only while verification endpoints
// are rate limited. It is not an unconditional guarantee.

namespace vid::signer {

static constexpr size_t MIN_SECRET_BYTES  = 32;
static constexpr size_t MIN_PAYLOAD_BYTES = 1;

// Throws std::invalid_argument on empty payload or secret shorter than 32 bytes,
// std::runtime_error if OpenSSL fails.
Signature sign(const uint8_t* payload, size_t payload_len,
               const uint8_t* secret,  size_t secret_len);
Signature sign(const Payload& payload, const Secret& secret);
Signature sign(const Payload& payload, const std::vector<uint8_t>& secret);

// Recomputes and compares in constant time. Never throws: any malformed
// argument (wrong signature length, short secret, empty payload) yields false.
bool verify(const uint8_t* payload,   size_t payload_len,
            const uint8_t* signature, size_t signature_len,
            const uint8_t* secret,    size_t secret_len) noexcept;
bool verify(const Payload& payload, const Signature& signature,
            const Secret& secret) noexcept;

} // namespace vid::signer
