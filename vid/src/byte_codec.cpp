#include "byte_codec.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace vid::bytes {

void put_u16be(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)((v >> 8) & 0xFF);
    p[1] = (uint8_t)((v >> 0) & 0xFF);
}

void put_u32be(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)((v >> 24) & 0xFF);
    p[1] = (uint8_t)((v >> 16) & 0xFF);
    p[2] = (uint8_t)((v >>  8) & 0xFF);
    p[3] = (uint8_t)((v >>  0) & 0xFF);
}

uint16_t read_u16be(const uint8_t* p) {
    return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
}

uint32_t read_u32be(const uint8_t* p) {
    return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
           ((uint32_t)p[2] <<  8) | ((uint32_t)p[3]);
}

uint64_t read_u48be(const uint8_t* p) {
    uint64_t high = read_u32be(p);
    uint64_t low  = read_u16be(p + 4);
    return high * 0x10000ULL + low;
}

// ── Payload ───────────────────────────────────────────────────────────────────

Payload encode_payload(uint8_t key_version, uint64_t timestamp,
                       uint16_t node_id, uint16_t sequence)
{
    if (timestamp > MAX_TIMESTAMP)
        throw std::out_of_range("encode_payload: timestamp " + std::to_string(timestamp) +
                                " exceeds 48 bits");

    Payload out{};
    out[OFFSET_KEY_VERSION] = key_version;
    put_u32be(out.data() + OFFSET_TIMESTAMP_HI, (uint32_t)(timestamp / 0x10000ULL));
    put_u16be(out.data() + OFFSET_TIMESTAMP_LO, (uint16_t)(timestamp % 0x10000ULL));
    put_u16be(out.data() + OFFSET_NODE_ID, node_id);
    put_u16be(out.data() + OFFSET_SEQUENCE, sequence);
    return out;
}

PayloadFields decode_payload(const uint8_t* data, size_t len) {
    if (!data || len < PAYLOAD_BYTES)
        throw std::invalid_argument("decode_payload: need " + std::to_string(PAYLOAD_BYTES) +
                                    " bytes, got " + std::to_string(data ? len : 0));

    PayloadFields f;
    f.key_version = data[OFFSET_KEY_VERSION];
    f.timestamp   = read_u48be(data + OFFSET_TIMESTAMP_HI);
    f.node_id     = read_u16be(data + OFFSET_NODE_ID);
    f.sequence    = read_u16be(data + OFFSET_SEQUENCE);
    return f;
}

// ── Array utilities ───────────────────────────────────────────────────────────

Binary concat(const Payload& payload, const Signature& signature) {
    Binary out;
    std::memcpy(out.data(), payload.data(), PAYLOAD_BYTES);
    std::memcpy(out.data() + OFFSET_SIGNATURE, signature.data(), SIGNATURE_BYTES);
    return out;
}

std::vector<uint8_t> concat(const uint8_t* a, size_t a_len,
                            const uint8_t* b, size_t b_len)
{
    std::vector<uint8_t> out;
    out.reserve(a_len + b_len);
    if (a_len) out.insert(out.end(), a, a + a_len);
    if (b_len) out.insert(out.end(), b, b + b_len);
    return out;
}

std::vector<uint8_t> copy(const uint8_t* src, size_t len) {
    if (!src || len == 0) return {};
    return std::vector<uint8_t>(src, src + len);
}

bool equal(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len) {
    if (a_len != b_len) return false;
    if (a_len == 0) return true;
    return std::memcmp(a, b, a_len) == 0;
}

} // namespace vid::bytes
