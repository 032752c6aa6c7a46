#include "signer.hpp"
#include "kdf.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

int main() {
    using namespace vid;
    bool ok = true;

    // RFC 4231 test case 6 (131-byte key), truncated to 7 bytes
    {
        std::vector<uint8_t> key(131, 0xAA);
        std::string msg = "Test Using Larger Than Block-Size Key - Hash Key First";
        Signature sig = signer::sign(reinterpret_cast<const uint8_t*>(msg.data()), msg.size(),
                                     key.data(), key.size());
        const uint8_t expect[SIGNATURE_BYTES] = { 0x60, 0xe4, 0x31, 0x59, 0x1e, 0xe0, 0xb6 };
        bool match = true;
        for (size_t i = 0; i < SIGNATURE_BYTES; ++i)
            match = match && sig[i] == expect[i];
        ok &= check(match, "RFC 4231 case 6 prefix mismatch");
    }

    Secret secret = kdf::derive_key("0123456789abcdef0123456789abcdef");
    Payload payload = { 1, 0x01, 0x8b, 0xcf, 0xe5, 0x68, 0x00, 0x66, 0x57, 0x00, 0x00 };

    // Cross-checked against an independent HMAC-SHA256 implementation
    Signature sig = signer::sign(payload, secret);
    const uint8_t known[SIGNATURE_BYTES] = { 0x01, 0xc8, 0x34, 0xbb, 0x36, 0xf1, 0xac };
    bool match = true;
    for (size_t i = 0; i < SIGNATURE_BYTES; ++i)
        match = match && sig[i] == known[i];
    ok &= check(match, "known payload signature mismatch");

    ok &= check(signer::sign(payload, secret) == sig, "signing is not deterministic");
    ok &= check(signer::verify(payload, sig, secret), "valid signature rejected");

    // Every single-bit flip in payload or signature must be rejected
    bool flips = true;
    for (size_t i = 0; i < PAYLOAD_BYTES * 8; ++i) {
        Payload p = payload;
        p[i / 8] ^= (uint8_t)(1u << (i % 8));
        flips = flips && !signer::verify(p, sig, secret);
    }
    for (size_t i = 0; i < SIGNATURE_BYTES * 8; ++i) {
        Signature s = sig;
        s[i / 8] ^= (uint8_t)(1u << (i % 8));
        flips = flips && !signer::verify(payload, s, secret);
    }
    ok &= check(flips, "bit flip accepted");

    Secret other = kdf::derive_key("fedcba9876543210fedcba9876543210");
    ok &= check(!signer::verify(payload, sig, other), "wrong secret accepted");

    // Malformed arguments: sign throws, verify returns false
    std::vector<uint8_t> short_secret(31, 0x11);
    bool threw = false;
    try { signer::sign(payload, short_secret); }
    catch (const std::invalid_argument&) { threw = true; }
    ok &= check(threw, "31-byte secret accepted by sign");

    threw = false;
    try { signer::sign(payload.data(), 0, secret.data(), secret.size()); }
    catch (const std::invalid_argument&) { threw = true; }
    ok &= check(threw, "empty payload accepted by sign");

    ok &= check(!signer::verify(payload.data(), payload.size(), sig.data(), sig.size(),
                                short_secret.data(), short_secret.size()),
                "verify accepted a short secret");
    ok &= check(!signer::verify(payload.data(), payload.size(), sig.data(), 6,
                                secret.data(), secret.size()),
                "verify accepted a 6-byte signature");
    ok &= check(!signer::verify(payload.data(), 0, sig.data(), sig.size(),
                                secret.data(), secret.size()),
                "verify accepted an empty payload");
    ok &= check(!signer::verify(nullptr, 11, sig.data(), sig.size(),
                                secret.data(), secret.size()),
                "verify accepted a null payload");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
