#pragma once
#include "vid.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vid::bytes {

// Big-endian field helpers. Callers guarantee the buffer is large enough.
void     put_u16be(uint8_t* p, uint16_t v);
void     put_u32be(uint8_t* p, uint32_t v);
uint16_t read_u16be(const uint8_t* p);
uint32_t read_u32be(const uint8_t* p);

// 48-bit timestamp stored as uint32 high || uint16 low.
uint64_t read_u48be(const uint8_t* p);

// Pack the 11-byte unsigned prefix.
// Throws std::out_of_range if timestamp exceeds 48 bits.
Payload encode_payload(uint8_t key_version, uint64_t timestamp,
                       uint16_t node_id, uint16_t sequence);

// Unpack the first 11 bytes of data.
// Throws std::invalid_argument if fewer than 11 bytes are supplied.
PayloadFields decode_payload(const uint8_t* data, size_t len);

// payload || signature
Binary concat(const Payload& payload, const Signature& signature);

std::vector<uint8_t> concat(const uint8_t* a, size_t a_len,
                            const uint8_t* b, size_t b_len);

std::vector<uint8_t> copy(const uint8_t* src, size_t len);

// Early-exit comparison. Not for secrets or signatures.
bool equal(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len);

} // namespace vid::bytes
