#pragma once
#include "vid.hpp"
#include "clock.hpp"
#include "generator.hpp"
#include "input.hpp"
#include "key_set.hpp"
#include "node_identity.hpp"
#include "parser.hpp"
#include "value.hpp"
#include "verifier.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace vid {

struct Config {
    std::map<int, std::string> keys;   // version -> raw secret (>= 16 bytes)
    int      current_key_version = -1;
    NodeSeed node;
};

// Injected process-wide providers. Defaults talk to the real system.
struct AuthorityOptions {
    Clock             clock  = system_clock();
    node::Environment env    = node::process_environment();
    node::RandomU16   random = node::secure_random();
    std::chrono::milliseconds max_clock_wait{5000};
    std::ostream*     warnings = &std::cerr;   // nullptr silences the random-node warning
};

struct DecodeOptions {
    bool verify = true;
    uint64_t min_timestamp = DEFAULT_MIN_TIMESTAMP;
};

// Owns the key set and node identity; the single entry point for minting,
// authenticating and decoding. Safe to share between threads: mint() is
// serialized internally, everything else is read-only.
class Authority {
public:
    // Throws ConfigError on any invalid configuration.
    explicit Authority(const Config& config, AuthorityOptions opts = AuthorityOptions());

    Authority(const Authority&) = delete;
    Authority& operator=(const Authority&) = delete;

    Value mint();

    // Untrusted input: never throws.
    template <typename T>
    bool authenticate(const T& input) const noexcept {
        return verifier::verify(make_input(input), keys_);
    }

    template <typename T>
    VerifyResult authenticate_detailed(const T& input) const noexcept {
        return verifier::verify_detailed(make_input(input), keys_);
    }

    // Authenticates first unless opts.verify is false.
    // Throws AuthenticationError or ParseError.
    template <typename T>
    Metadata decode(const T& input, const DecodeOptions& opts = DecodeOptions()) const {
        return decode_input(make_input(input), opts);
    }

    uint16_t              node_id() const { return resolution_.node_id; }
    const NodeResolution& node_resolution() const { return resolution_; }
    uint8_t               current_key_version() const { return current_version_; }
    std::vector<uint8_t>  key_versions() const { return keys_.versions(); }

private:
    static KeySet  build_keys(const Config& config);
    static uint8_t check_current(const Config& config);
    Metadata decode_input(const Input& input, const DecodeOptions& opts) const;

    const KeySet   keys_;
    const uint8_t  current_version_;
    NodeResolution resolution_;
    std::mutex     mint_mu_;
    Generator      generator_;
};

} // namespace vid
