#include "authority.hpp"
#include <string>
#include <utility>

namespace vid {

KeySet Authority::build_keys(const Config& config) {
    return KeySet::derive(config.keys);
}

uint8_t Authority::check_current(const Config& config) {
    int v = config.current_key_version;
    if (v < 0 || v > MAX_KEY_VERSION)
        throw ConfigError("current key version must be between 0 and " +
                          std::to_string(MAX_KEY_VERSION) + " (got " + std::to_string(v) + ")");
    if (config.keys.find(v) == config.keys.end())
        throw ConfigError("current key version " + std::to_string(v) +
                          " is not present in keys; add a secret for it");
    return (uint8_t)v;
}

static GeneratorOptions generator_options(const AuthorityOptions& opts) {
    GeneratorOptions g;
    if (opts.clock) g.clock = opts.clock;
    g.max_clock_wait = opts.max_clock_wait;
    return g;
}

Authority::Authority(const Config& config, AuthorityOptions opts)
    : keys_(build_keys(config)),
      current_version_(check_current(config)),
      resolution_(node::resolve(config.node, opts.env, opts.random)),
      generator_(resolution_.node_id, generator_options(opts))
{
    if (!resolution_.warning.empty() && opts.warnings)
        *opts.warnings << "Warning: " << resolution_.warning << "\n";
}

Value Authority::mint() {
    const Secret* secret = keys_.find(current_version_);
    if (!secret)
        throw ConfigError("no secret for current key version " +
                          std::to_string(current_version_));

    std::lock_guard<std::mutex> lock(mint_mu_);
    return generator_.mint(current_version_, *secret);
}

Metadata Authority::decode_input(const Input& input, const DecodeOptions& opts) const {
    if (opts.verify) {
        VerifyResult r = verifier::verify_detailed(input, keys_);
        if (!r.valid)
            throw AuthenticationError(r.reason);
    }

    parser::ParseOptions p;
    p.min_timestamp = opts.min_timestamp;
    return parser::parse(input, p);
}

} // namespace vid
