#include "parser.hpp"
#include "base32.hpp"
#include "byte_codec.hpp"
#include <cstdio>
#include <ctime>
#include <string>

namespace vid::parser {

std::string format_iso8601(uint64_t timestamp_ms) {
    std::time_t secs = (std::time_t)(timestamp_ms / 1000);
    unsigned millis  = (unsigned)(timestamp_ms % 1000);

    struct tm gmt;
    if (!gmtime_r(&secs, &gmt))
        throw ParseError("timestamp " + std::to_string(timestamp_ms) +
                         " cannot be represented as a calendar date");

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &gmt);
    if (n == 0)
        throw ParseError("strftime failed for timestamp " + std::to_string(timestamp_ms));

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03uZ", buf, millis);
    return std::string(out);
}

static Binary decode_text(std::string_view text) {
    std::string norm = base32::normalize(text);

    if (norm.size() != TEXT_CHARS)
        throw ParseError("id strings must be exactly " + std::to_string(TEXT_CHARS) +
                         " characters (got " + std::to_string(norm.size()) + ")");
    if (!base32::all_in_alphabet(norm))
        throw ParseError("id string contains characters outside the base32 alphabet (A-Z, 2-7)");

    try {
        return base32::decode(norm);
    } catch (const base32::DecodeError& e) {
        throw ParseError(std::string("base32 decoding failed: ") + e.what());
    }
}

Metadata parse(const Input& input, const ParseOptions& opts) {
    Binary decoded{};
    const uint8_t* bin = nullptr;
    size_t bin_len = 0;

    switch (input.kind()) {
        case Input::Kind::Null:
            throw ParseError("input is required (got null)");
        case Input::Kind::Unsupported:
            throw ParseError("unsupported input type; accepted: base32 text, "
                             "byte buffers, vid::Value");
        case Input::Kind::Text:
            decoded = decode_text(input.str());
            bin     = decoded.data();
            bin_len = decoded.size();
            break;
        case Input::Kind::Bytes:
            bin     = input.data();
            bin_len = input.size();
            break;
    }

    if (!bin || bin_len != BINARY_BYTES)
        throw ParseError("binary must be exactly " + std::to_string(BINARY_BYTES) +
                         " bytes (got " + std::to_string(bin ? bin_len : 0) + ")");

    PayloadFields f = bytes::decode_payload(bin, bin_len);

    if (f.timestamp < opts.min_timestamp || f.timestamp > MAX_TIMESTAMP)
        throw ParseError("decoded timestamp " + std::to_string(f.timestamp) +
                         " is outside [" + std::to_string(opts.min_timestamp) + ", " +
                         std::to_string(MAX_TIMESTAMP) + "]; the binary may be corrupt "
                         "or from an untrusted source");

    Metadata m;
    m.key_version = f.key_version;
    m.timestamp   = f.timestamp;
    m.time        = decltype(m.time)(std::chrono::milliseconds((long long)f.timestamp));
    m.iso         = format_iso8601(f.timestamp);
    m.node_id     = f.node_id;
    m.sequence    = f.sequence;
    return m;
}

} // namespace vid::parser
