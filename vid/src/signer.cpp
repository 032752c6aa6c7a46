#include "signer.hpp"
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <string>

namespace vid::signer {

// Full 32-byte HMAC-SHA256(key, msg).
static void hmac_sha256(const uint8_t* key, size_t key_len,
                        const uint8_t* msg, size_t msg_len,
                        uint8_t out[32])
{
    EVP_MAC* mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!mac) throw std::runtime_error("EVP_MAC_fetch(HMAC) failed");

    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
    if (!ctx) {
        EVP_MAC_free(mac);
        throw std::runtime_error("EVP_MAC_CTX_new failed");
    }

    char digest_name[] = "SHA256";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
        OSSL_PARAM_construct_end()
    };

    size_t out_len = 0;
    if (EVP_MAC_init(ctx, key, key_len, params) != 1 ||
        EVP_MAC_update(ctx, msg, msg_len) != 1 ||
        EVP_MAC_final(ctx, out, &out_len, 32) != 1 ||
        out_len != 32) {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    EVP_MAC_CTX_free(ctx);
    EVP_MAC_free(mac);
}

// ── sign ──────────────────────────────────────────────────────────────────────

Signature sign(const uint8_t* payload, size_t payload_len,
               const uint8_t* secret,  size_t secret_len)
{
    if (!payload || payload_len < MIN_PAYLOAD_BYTES)
        throw std::invalid_argument("signer::sign: payload must not be empty");
    if (!secret || secret_len < MIN_SECRET_BYTES)
        throw std::invalid_argument("signer::sign: secret must be at least " +
                                    std::to_string(MIN_SECRET_BYTES) + " bytes (got " +
                                    std::to_string(secret ? secret_len : 0) + ")");

    uint8_t digest[32];
    hmac_sha256(secret, secret_len, payload, payload_len, digest);

    Signature sig;
    std::memcpy(sig.data(), digest, SIGNATURE_BYTES);
    OPENSSL_cleanse(digest, sizeof(digest));
    return sig;
}

Signature sign(const Payload& payload, const Secret& secret) {
    return sign(payload.data(), payload.size(), secret.data(), secret.size());
}

Signature sign(const Payload& payload, const std::vector<uint8_t>& secret) {
    return sign(payload.data(), payload.size(), secret.data(), secret.size());
}

// ── verify ────────────────────────────────────────────────────────────────────

bool verify(const uint8_t* payload,   size_t payload_len,
            const uint8_t* signature, size_t signature_len,
            const uint8_t* secret,    size_t secret_len) noexcept
{
    if (!payload || !signature || !secret)
        return false;
    if (payload_len < MIN_PAYLOAD_BYTES || secret_len < MIN_SECRET_BYTES)
        return false;
    if (signature_len != SIGNATURE_BYTES)
        return false;

    Signature expected;
    try {
        expected = sign(payload, payload_len, secret, secret_len);
    } catch (const std::exception&) {
        return false;
    }

    return CRYPTO_memcmp(expected.data(), signature, SIGNATURE_BYTES) == 0;
}

bool verify(const Payload& payload, const Signature& signature,
            const Secret& secret) noexcept
{
    return verify(payload.data(), payload.size(),
                  signature.data(), signature.size(),
                  secret.data(), secret.size());
}

} // namespace vid::signer
