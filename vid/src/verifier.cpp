#include "verifier.hpp"
#include "base32.hpp"
#include "signer.hpp"
#include <exception>

namespace vid::verifier {

// Text -> 18 bytes, or the failure reason. Alphabet is checked before length,
// so obviously non-base32 text reports InvalidStringChars whatever its size.
static VerifyFailure decode_text(std::string_view text, Binary& out) noexcept {
    std::string norm;
    try {
        norm = base32::normalize(text);
    } catch (const std::exception&) {
        return VerifyFailure::DecodeError;
    }

    if (!base32::all_in_alphabet(norm))
        return VerifyFailure::InvalidStringChars;
    if (norm.size() != TEXT_CHARS)
        return VerifyFailure::InvalidStringLength;

    try {
        out = base32::decode(norm);
    } catch (const std::exception&) {
        return VerifyFailure::DecodeError;
    }
    return VerifyFailure::None;
}

VerifyResult verify_detailed(const Input& input, const KeySet& keys) noexcept {
    Binary decoded{};
    const uint8_t* bin = nullptr;
    size_t bin_len = 0;

    switch (input.kind()) {
        case Input::Kind::Null:
            return VerifyResult::fail(VerifyFailure::NullInput);
        case Input::Kind::Unsupported:
            return VerifyResult::fail(VerifyFailure::UnsupportedType);
        case Input::Kind::Text: {
            VerifyFailure f = decode_text(input.str(), decoded);
            if (f != VerifyFailure::None)
                return VerifyResult::fail(f);
            bin     = decoded.data();
            bin_len = decoded.size();
            break;
        }
        case Input::Kind::Bytes:
            bin     = input.data();
            bin_len = input.size();
            break;
    }

    if (!bin || bin_len != BINARY_BYTES)
        return VerifyResult::fail(VerifyFailure::InvalidBinaryLength);

    const Secret* secret = keys.find(bin[OFFSET_KEY_VERSION]);
    if (!secret)
        return VerifyResult::fail(VerifyFailure::UnknownKeyVersion);

    bool ok = signer::verify(bin, PAYLOAD_BYTES,
                             bin + OFFSET_SIGNATURE, SIGNATURE_BYTES,
                             secret->data(), secret->size());
    if (!ok)
        return VerifyResult::fail(VerifyFailure::SignatureMismatch);

    return VerifyResult::ok();
}

bool verify(const Input& input, const KeySet& keys) noexcept {
    return verify_detailed(input, keys).valid;
}

} // namespace vid::verifier
