#include "value.hpp"
#include "base32.hpp"
#include <cstring>
#include <stdexcept>
#include <utility>

namespace vid {

Value::Value(Binary binary)
    : binary_(std::move(binary)), text_(base32::encode(binary_)) {}

Value Value::from_binary(const uint8_t* data, size_t len) {
    if (!data || len != BINARY_BYTES)
        throw std::invalid_argument("Value: binary must be exactly " +
                                    std::to_string(BINARY_BYTES) + " bytes (got " +
                                    std::to_string(data ? len : 0) + ")");
    Binary b;
    std::memcpy(b.data(), data, BINARY_BYTES);
    return Value(b);
}

Value Value::from_string(std::string_view text) {
    return Value(base32::decode(text));
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << v.to_string();
}

} // namespace vid
