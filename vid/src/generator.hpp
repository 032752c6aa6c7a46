#pragma once
#include "vid.hpp"
#include "clock.hpp"
#include "value.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace vid {

struct GeneratorOptions {
    Clock clock = system_clock();

    // Upper bound on the overflow spin-wait before ClockFault.
    std::chrono::milliseconds max_clock_wait{5000};
};

// Stateful minting for one node.
//
// Uniqueness: timestamp + sequence within a node (65 536 ids per ms),
// node_id across nodes. Binary sort order equals mint order.
//
// Not synchronized. At most one mint() in flight per instance; run one
// Generator per thread, each with its own node id, or lock externally.
class Generator {
public:
    explicit Generator(uint16_t node_id, GeneratorOptions opts = GeneratorOptions());

    // Throws ConfigError if secret is shorter than 32 bytes (before touching
    // state), ClockFault if the clock stays frozen through a sequence overflow,
    // TimestampOverflow past the 48-bit ceiling.
    Value mint(uint8_t key_version, const Secret& secret);
    Value mint(uint8_t key_version, const std::vector<uint8_t>& secret);

    uint16_t node_id()        const { return node_id_; }
    uint64_t last_timestamp() const { return last_timestamp_; }
    uint32_t sequence()       const { return sequence_; }

    // Times the sequence ran out and mint() waited for the next millisecond.
    uint64_t overflow_waits() const { return overflow_waits_; }

private:
    Value    mint_raw(uint8_t key_version, const uint8_t* secret, size_t secret_len);
    uint64_t next_tick(uint64_t since);

    uint16_t         node_id_;
    GeneratorOptions opts_;
    uint64_t         last_timestamp_ = 0;
    uint32_t         sequence_       = 0;
    uint64_t         overflow_waits_ = 0;
};

} // namespace vid
