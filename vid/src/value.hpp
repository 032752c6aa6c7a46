#pragma once
#include "vid.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace vid {

// Immutable identifier. Owns its 18 bytes; every binary read returns a copy.
// The base32 text is computed once, at construction.
class Value {
public:
    explicit Value(Binary binary);

    // Copies len bytes. Throws std::invalid_argument unless len == 18.
    static Value from_binary(const uint8_t* data, size_t len);

    // Trims, upper-cases and decodes. Throws base32::DecodeError.
    static Value from_string(std::string_view text);

    Binary             to_binary() const { return binary_; }
    const std::string& to_string() const { return text_; }

    uint8_t key_version() const { return binary_[OFFSET_KEY_VERSION]; }

    bool operator==(const Value& o) const { return binary_ == o.binary_; }
    bool operator!=(const Value& o) const { return binary_ != o.binary_; }
    bool operator< (const Value& o) const { return binary_ <  o.binary_; }

private:
    Binary      binary_;
    std::string text_;
};

std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace vid
