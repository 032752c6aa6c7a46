#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

// Binary layout (18 bytes, big-endian):
//   [0]      keyVersion   1 byte
//   [1..6]   timestamp    6 bytes  ms since Unix epoch (uint32 high || uint16 low)
//   [7..8]   nodeId       2 bytes
//   [9..10]  sequence     2 bytes
//   [11..17] signature    7 bytes  HMAC-SHA256(secret, bytes 0..10)[0..6]

namespace vid {

static constexpr size_t PAYLOAD_BYTES   = 11;
static constexpr size_t SIGNATURE_BYTES = 7;
static constexpr size_t BINARY_BYTES    = PAYLOAD_BYTES + SIGNATURE_BYTES;  // 18
static constexpr size_t TEXT_CHARS      = 29;  // ceil(18 * 8 / 5)
static constexpr size_t SECRET_BYTES    = 32;  // SHA-256 of the raw secret

static constexpr size_t OFFSET_KEY_VERSION   = 0;
static constexpr size_t OFFSET_TIMESTAMP_HI  = 1;   // uint32
static constexpr size_t OFFSET_TIMESTAMP_LO  = 5;   // uint16
static constexpr size_t OFFSET_NODE_ID       = 7;
static constexpr size_t OFFSET_SEQUENCE      = 9;
static constexpr size_t OFFSET_SIGNATURE     = 11;

static constexpr uint64_t MAX_TIMESTAMP = 0xFFFFFFFFFFFFULL;  // 48 bits, ~year 10895
static constexpr uint32_t MAX_SEQUENCE  = 0xFFFF;
static constexpr uint32_t MAX_NODE_ID   = 0xFFFF;
static constexpr int      MAX_KEY_VERSION = 0xFF;

// 2020-01-01T00:00:00.000Z; parser rejects anything older by default.
static constexpr uint64_t DEFAULT_MIN_TIMESTAMP = 1577836800000ULL;

using Binary    = std::array<uint8_t, BINARY_BYTES>;
using Payload   = std::array<uint8_t, PAYLOAD_BYTES>;
using Signature = std::array<uint8_t, SIGNATURE_BYTES>;
using Secret    = std::array<uint8_t, SECRET_BYTES>;

struct PayloadFields {
    uint8_t  key_version = 0;
    uint64_t timestamp   = 0;
    uint16_t node_id     = 0;
    uint16_t sequence    = 0;
};

// Structural view of an identifier. Says nothing about authenticity.
struct Metadata {
    uint8_t  key_version = 0;
    uint64_t timestamp   = 0;
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds> time;
    std::string iso;            // YYYY-MM-DDTHH:MM:SS.mmmZ
    uint16_t node_id     = 0;
    uint16_t sequence    = 0;
};

// ── Verification results ─────────────────────────────────────────────────────
// Internal diagnostics only: never hand the reason back to an untrusted caller.

enum class VerifyFailure {
    None,
    NullInput,
    UnsupportedType,
    InvalidStringLength,
    InvalidStringChars,
    InvalidBinaryLength,
    UnknownKeyVersion,
    SignatureMismatch,
    DecodeError
};

struct VerifyResult {
    bool          valid  = false;
    VerifyFailure reason = VerifyFailure::None;

    static VerifyResult ok() { return VerifyResult{true, VerifyFailure::None}; }
    static VerifyResult fail(VerifyFailure r) { return VerifyResult{false, r}; }

    explicit operator bool() const { return valid; }
};

// "NULL_INPUT", "SIGNATURE_MISMATCH", ... ("NONE" for a valid result)
const char* to_string(VerifyFailure reason);

// ── Node identity ────────────────────────────────────────────────────────────

enum class NodeSource { ExplicitNumber, ExplicitString, PodIp, Hostname, Random };

const char* to_string(NodeSource source);

// Optional node-identity seed from configuration: nothing, a number, or text.
struct NodeSeed {
    enum class Kind { None, Number, Text };

    Kind        kind   = Kind::None;
    long long   number = 0;
    std::string text;

    static NodeSeed none() { return NodeSeed{}; }
    static NodeSeed from_number(long long n) {
        NodeSeed s;
        s.kind   = Kind::Number;
        s.number = n;
        return s;
    }
    static NodeSeed from_text(std::string t) {
        NodeSeed s;
        s.kind = Kind::Text;
        s.text = std::move(t);
        return s;
    }
};

struct NodeResolution {
    uint16_t    node_id = 0;
    NodeSource  source  = NodeSource::Random;
    std::string warning;        // non-empty only for NodeSource::Random
};

// ── Faults (trusted / configuration paths) ───────────────────────────────────

struct ConfigError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

struct ClockFault : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TimestampOverflow : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class AuthenticationError : public std::runtime_error {
public:
    explicit AuthenticationError(VerifyFailure reason);
    VerifyFailure reason() const { return reason_; }

private:
    VerifyFailure reason_;
};

} // namespace vid
