#include "key_set.hpp"
#include "kdf.hpp"
#include <utility>

namespace vid {

KeySet KeySet::derive(const std::map<int, std::string>& raw_secrets) {
    if (raw_secrets.empty())
        throw ConfigError("keys must contain at least one entry");

    std::map<uint8_t, Secret> derived;
    for (const auto& [version, raw] : raw_secrets) {
        if (version < 0 || version > MAX_KEY_VERSION)
            throw ConfigError("key version must be between 0 and " +
                              std::to_string(MAX_KEY_VERSION) + " (got " +
                              std::to_string(version) + ")");
        if (raw.size() < MIN_RAW_SECRET_BYTES)
            throw ConfigError("secret for key version " + std::to_string(version) +
                              " must be at least " + std::to_string(MIN_RAW_SECRET_BYTES) +
                              " bytes (got " + std::to_string(raw.size()) + ")");
        derived[(uint8_t)version] = kdf::derive_key(raw);
    }
    return KeySet(std::move(derived));
}

KeySet::KeySet(std::map<uint8_t, Secret> secrets)
    : secrets_(std::move(secrets))
{
    if (secrets_.empty())
        throw ConfigError("key set must contain at least one entry");
}

const Secret* KeySet::find(uint8_t version) const {
    auto it = secrets_.find(version);
    if (it == secrets_.end()) return nullptr;
    return &it->second;
}

std::vector<uint8_t> KeySet::versions() const {
    std::vector<uint8_t> out;
    out.reserve(secrets_.size());
    for (const auto& kv : secrets_)
        out.push_back(kv.first);
    return out;
}

} // namespace vid
