#pragma once
#include "vid.hpp"
#include "input.hpp"

// Structural decode only. Signature validity is not checked here: callers
// that care about authenticity verify first (Authority::decode does).

namespace vid::parser {

struct ParseOptions {
    // Timestamps below this are treated as corrupt.
    uint64_t min_timestamp = DEFAULT_MIN_TIMESTAMP;
};

// Throws ParseError on null/unsupported input, text that is not 29 base32
// characters, binary that is not 18 bytes, or a timestamp outside
// [min_timestamp, 2^48-1].
Metadata parse(const Input& input, const ParseOptions& opts = ParseOptions());

template <typename T>
Metadata parse(const T& input, const ParseOptions& opts = ParseOptions()) {
    return parse(make_input(input), opts);
}

// "YYYY-MM-DDTHH:MM:SS.mmmZ" for a ms-since-epoch timestamp.
std::string format_iso8601(uint64_t timestamp_ms);

} // namespace vid::parser
