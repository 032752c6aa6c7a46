#include "base32.hpp"

namespace vid::base32 {

static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

static const int8_t kDecode[128] = {
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,26,27,28,29,30,31,-1,-1,-1,-1,-1,-1,-1,-1,
    -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
    15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
    -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
};

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

int char_value(char c) {
    unsigned char u = (unsigned char)c;
    if (u >= 128) return -1;
    return kDecode[u];
}

std::string normalize(std::string_view text) {
    size_t b = 0, e = text.size();
    while (b < e && is_space(text[b]))     ++b;
    while (e > b && is_space(text[e - 1])) --e;

    std::string out(text.substr(b, e - b));
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    }
    return out;
}

bool all_in_alphabet(std::string_view text) {
    for (char c : text) {
        if (char_value(c) < 0) return false;
    }
    return true;
}

// ── Encode ────────────────────────────────────────────────────────────────────

std::string encode(const uint8_t* data, size_t len) {
    if (!data || len != BINARY_BYTES)
        throw std::invalid_argument("base32::encode: input must be exactly " +
                                    std::to_string(BINARY_BYTES) + " bytes (got " +
                                    std::to_string(data ? len : 0) + ")");

    std::string out;
    out.reserve(TEXT_CHARS);

    uint32_t buf = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        buf = (buf << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out += kAlphabet[(buf >> bits) & 0x1F];
        }
        buf &= (1u << bits) - 1;   // keep only the unread bits
    }
    if (bits > 0)
        out += kAlphabet[(buf << (5 - bits)) & 0x1F];

    return out;
}

std::string encode(const Binary& binary) {
    return encode(binary.data(), binary.size());
}

// ── Decode ────────────────────────────────────────────────────────────────────

Binary decode(std::string_view text) {
    std::string norm = normalize(text);

    if (norm.size() != TEXT_CHARS)
        throw DecodeError(DecodeError::Kind::Length, DecodeError::npos,
                          "base32::decode: expected " + std::to_string(TEXT_CHARS) +
                          " characters after trimming, got " + std::to_string(norm.size()));

    Binary out{};
    size_t n = 0;
    uint32_t buf = 0;
    int bits = 0;

    for (size_t i = 0; i < norm.size(); ++i) {
        int val = char_value(norm[i]);
        if (val < 0)
            throw DecodeError(DecodeError::Kind::Character, i,
                              "base32::decode: invalid character at position " +
                              std::to_string(i) + " (valid: A-Z, 2-7)");
        buf = (buf << 5) | (uint32_t)val;
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            if (n < out.size())
                out[n] = (uint8_t)((buf >> bits) & 0xFF);
            ++n;
        }
        buf &= (1u << bits) - 1;
    }
    // Any remaining bits are encoder padding and are discarded.

    if (n != BINARY_BYTES)
        throw DecodeError(DecodeError::Kind::Internal, DecodeError::npos,
                          "base32::decode: produced " + std::to_string(n) +
                          " bytes, expected " + std::to_string(BINARY_BYTES));
    return out;
}

} // namespace vid::base32
