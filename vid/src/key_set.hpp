#pragma once
#include "vid.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace vid {

static constexpr size_t MIN_RAW_SECRET_BYTES = 16;

// keyVersion -> 32-byte derived secret. Immutable once built; rotate by
// building a new set. Raw secrets are hashed on the way in and not kept.
class KeySet {
public:
    // Each raw secret must be at least 16 UTF-8 bytes; versions 0-255;
    // at least one entry. Throws ConfigError.
    static KeySet derive(const std::map<int, std::string>& raw_secrets);

    // Already-derived secrets. Throws ConfigError on an empty map.
    explicit KeySet(std::map<uint8_t, Secret> secrets);

    // nullptr if the version is unknown.
    const Secret* find(uint8_t version) const;

    bool   contains(uint8_t version) const { return find(version) != nullptr; }
    size_t size() const { return secrets_.size(); }
    std::vector<uint8_t> versions() const;

private:
    std::map<uint8_t, Secret> secrets_;
};

} // namespace vid
