#include "vid.hpp"

namespace vid {

const char* to_string(VerifyFailure reason) {
    switch (reason) {
        case VerifyFailure::None:                return "NONE";
        case VerifyFailure::NullInput:           return "NULL_INPUT";
        case VerifyFailure::UnsupportedType:     return "UNSUPPORTED_TYPE";
        case VerifyFailure::InvalidStringLength: return "INVALID_STRING_LENGTH";
        case VerifyFailure::InvalidStringChars:  return "INVALID_STRING_CHARS";
        case VerifyFailure::InvalidBinaryLength: return "INVALID_BINARY_LENGTH";
        case VerifyFailure::UnknownKeyVersion:   return "UNKNOWN_KEY_VERSION";
        case VerifyFailure::SignatureMismatch:   return "SIGNATURE_MISMATCH";
        case VerifyFailure::DecodeError:         return "DECODE_ERROR";
    }
    return "UNKNOWN";
}

const char* to_string(NodeSource source) {
    switch (source) {
        case NodeSource::ExplicitNumber: return "explicit_number";
        case NodeSource::ExplicitString: return "explicit_string";
        case NodeSource::PodIp:          return "pod_ip";
        case NodeSource::Hostname:       return "hostname";
        case NodeSource::Random:         return "random";
    }
    return "unknown";
}

AuthenticationError::AuthenticationError(VerifyFailure reason)
    : std::runtime_error(std::string("verification failed before decoding (") +
                         to_string(reason) + "); the id was not issued with a known key"),
      reason_(reason) {}

} // namespace vid
