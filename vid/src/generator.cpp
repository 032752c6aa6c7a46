#include "generator.hpp"
#include "byte_codec.hpp"
#include "signer.hpp"
#include <string>
#include <utility>

namespace vid {

Generator::Generator(uint16_t node_id, GeneratorOptions opts)
    : node_id_(node_id), opts_(std::move(opts))
{
    if (!opts_.clock)
        opts_.clock = system_clock();
}

Value Generator::mint(uint8_t key_version, const Secret& secret) {
    return mint_raw(key_version, secret.data(), secret.size());
}

Value Generator::mint(uint8_t key_version, const std::vector<uint8_t>& secret) {
    return mint_raw(key_version, secret.data(), secret.size());
}

// Spin until the clock moves strictly past `since`, bounded by max_clock_wait.
uint64_t Generator::next_tick(uint64_t since) {
    auto deadline = std::chrono::steady_clock::now() + opts_.max_clock_wait;
    uint64_t now;
    do {
        now = opts_.clock();
        if (now > since)
            break;
        if (std::chrono::steady_clock::now() > deadline)
            throw ClockFault("clock frozen or regressed: waited " +
                             std::to_string(opts_.max_clock_wait.count()) +
                             "ms for time to advance past " + std::to_string(since) +
                             "; check NTP, container time or VM migration");
    } while (true);
    return now;
}

Value Generator::mint_raw(uint8_t key_version, const uint8_t* secret, size_t secret_len) {
    if (!secret || secret_len < signer::MIN_SECRET_BYTES)
        throw ConfigError("secret must be at least " +
                          std::to_string(signer::MIN_SECRET_BYTES) + " bytes (got " +
                          std::to_string(secret ? secret_len : 0) + ")");

    uint64_t t = opts_.clock();

    // Never move backward; ids stay sorted at the cost of a stale timestamp.
    if (t < last_timestamp_)
        t = last_timestamp_;

    if (t == last_timestamp_) {
        if (++sequence_ > MAX_SEQUENCE) {
            ++overflow_waits_;
            t = next_tick(last_timestamp_);
            sequence_ = 0;
        }
    } else {
        sequence_ = 0;
    }

    last_timestamp_ = t;

    if (t > MAX_TIMESTAMP)
        throw TimestampOverflow("timestamp " + std::to_string(t) +
                                " exceeds the 48-bit maximum " + std::to_string(MAX_TIMESTAMP));

    Payload payload = bytes::encode_payload(key_version, t, node_id_, (uint16_t)sequence_);
    Signature sig   = signer::sign(payload.data(), payload.size(), secret, secret_len);
    return Value(bytes::concat(payload, sig));
}

} // namespace vid
