#include "input.hpp"

namespace vid {

// A null pointer with a length is missing input; with len == 0 it is just an
// empty buffer (std::vector<uint8_t>{}.data() may be null).
Input Input::bytes(const uint8_t* data, size_t len) {
    if (!data && len != 0) return null();
    Input in(Kind::Bytes);
    in.data_ = data;
    in.size_ = data ? len : 0;
    return in;
}

Input Input::text(std::string_view text) {
    Input in(Kind::Text);
    in.text_ = text;
    return in;
}

Input Input::value(const Value& v) {
    Input in(Kind::Bytes);
    in.owned_     = true;
    in.owned_bin_ = v.to_binary();
    in.size_      = in.owned_bin_.size();
    return in;
}

} // namespace vid
