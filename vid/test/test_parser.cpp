#include "parser.hpp"
#include "byte_codec.hpp"
#include <iostream>
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

template <typename T>
static bool throws_parse(const T& input, const vid::parser::ParseOptions& opts = {}) {
    try {
        vid::parser::parse(input, opts);
    } catch (const vid::ParseError&) {
        return true;
    }
    return false;
}

static vid::Binary unsigned_id(uint64_t timestamp) {
    vid::Payload p = vid::bytes::encode_payload(7, timestamp, 0xBEEF, 513);
    return vid::bytes::concat(p, vid::Signature{});
}

int main() {
    using namespace vid;
    bool ok = true;

    // Signature bytes are not checked
    Binary b = unsigned_id(1700000000000ULL);
    Metadata m = parser::parse(b);
    ok &= check(m.key_version == 7,                  "key_version");
    ok &= check(m.timestamp   == 1700000000000ULL,   "timestamp");
    ok &= check(m.node_id     == 0xBEEF,             "node_id");
    ok &= check(m.sequence    == 513,                "sequence");
    ok &= check(m.iso == "2023-11-14T22:13:20.000Z", "iso");
    ok &= check(m.time.time_since_epoch().count() == 1700000000000LL, "time");

    // Same result from text and Value
    Value v(b);
    Metadata mt = parser::parse(v.to_string());
    ok &= check(mt.timestamp == m.timestamp && mt.sequence == m.sequence, "text parse");
    Metadata mv = parser::parse(v);
    ok &= check(mv.node_id == m.node_id, "Value parse");

    ok &= check(parser::format_iso8601(1700000000123ULL) == "2023-11-14T22:13:20.123Z", "millis");
    ok &= check(parser::format_iso8601(DEFAULT_MIN_TIMESTAMP) == "2020-01-01T00:00:00.000Z",
                "2020 epoch");

    // Timestamp guard
    ok &= check(throws_parse(unsigned_id(DEFAULT_MIN_TIMESTAMP - 1)), "pre-2020 accepted");
    ok &= check(!throws_parse(unsigned_id(DEFAULT_MIN_TIMESTAMP)), "2020-01-01 rejected");
    parser::ParseOptions loose;
    loose.min_timestamp = 0;
    ok &= check(!throws_parse(unsigned_id(5), loose), "min_timestamp option ignored");
    ok &= check(parser::parse(unsigned_id(MAX_TIMESTAMP), loose).timestamp == MAX_TIMESTAMP,
                "max timestamp");

    // Malformed input
    std::vector<uint8_t> seventeen(17, 0);
    ok &= check(throws_parse(nullptr),                          "null");
    ok &= check(throws_parse(12345),                            "int");
    ok &= check(throws_parse(seventeen),                        "17 bytes");

    // An empty buffer is a length error, not missing input
    std::vector<uint8_t> empty;
    std::string what;
    try {
        parser::parse(empty);
    } catch (const ParseError& e) {
        what = e.what();
    }
    ok &= check(what.find("18 bytes (got 0)") != std::string::npos, "empty buffer reported as null");
    ok &= check(throws_parse("AEAYXT7FNAAGMVYAAAA4QNF3G3Y2"),   "28 chars");
    ok &= check(throws_parse("AEAYXT7FNAAGMVYAAAA4QNF3G3Y2!"),  "bad char");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
