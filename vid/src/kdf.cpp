#include "kdf.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace vid::kdf {

std::array<uint8_t, 32> sha256(const uint8_t* data, size_t len) {
    std::array<uint8_t, 32> out;
    unsigned int out_len = 0;
    static const uint8_t kEmpty = 0;
    if (EVP_Digest(data ? data : &kEmpty, data ? len : 0,
                   out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != out.size())
        throw std::runtime_error("SHA-256 digest failed");
    return out;
}

Secret derive_key(std::string_view raw_secret) {
    return sha256(reinterpret_cast<const uint8_t*>(raw_secret.data()), raw_secret.size());
}

uint16_t hash_to_u16(std::string_view text) {
    auto digest = sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return (uint16_t)(((uint16_t)digest[0] << 8) | (uint16_t)digest[1]);
}

} // namespace vid::kdf
