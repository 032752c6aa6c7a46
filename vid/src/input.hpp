#pragma once
#include "vid.hpp"
#include "value.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vid {

// Generic read-only view over a binary buffer.
struct ByteView {
    const void* data = nullptr;
    size_t      size = 0;
};

// Any accepted identifier representation, normalized for the verifier and
// parser. Non-owning except when built from a Value (which only hands out
// copies). The referenced bytes/text must outlive the Input.
class Input {
public:
    enum class Kind { Null, Bytes, Text, Unsupported };

    static Input null()        { return Input(Kind::Null); }
    static Input unsupported() { return Input(Kind::Unsupported); }
    static Input bytes(const uint8_t* data, size_t len);
    static Input text(std::string_view text);
    static Input value(const Value& v);

    Kind             kind() const { return kind_; }
    const uint8_t*   data() const { return owned_ ? owned_bin_.data() : data_; }
    size_t           size() const { return size_; }
    std::string_view str()  const { return text_; }

private:
    explicit Input(Kind kind) : kind_(kind) {}

    Kind             kind_;
    const uint8_t*   data_  = nullptr;
    size_t           size_  = 0;
    std::string_view text_;
    bool             owned_ = false;
    Binary           owned_bin_{};
};

// ── make_input ────────────────────────────────────────────────────────────────
// Overloads for every accepted representation; anything else lands on the
// catch-all template and normalizes to Kind::Unsupported.

inline Input make_input(const Input& in)                  { return in; }
inline Input make_input(std::nullptr_t)                   { return Input::null(); }
inline Input make_input(const char* s)                    { return s ? Input::text(s) : Input::null(); }
inline Input make_input(const std::string& s)             { return Input::text(s); }
inline Input make_input(std::string_view s)               { return Input::text(s); }
inline Input make_input(const std::vector<uint8_t>& v)    { return Input::bytes(v.data(), v.size()); }
inline Input make_input(const Value& v)                   { return Input::value(v); }
inline Input make_input(const ByteView& b) {
    return Input::bytes(static_cast<const uint8_t*>(b.data), b.size);
}
inline Input make_input(const uint8_t* data, size_t len) { return Input::bytes(data, len); }

template <size_t N>
Input make_input(const std::array<uint8_t, N>& a) { return Input::bytes(a.data(), a.size()); }

template <typename T>
Input make_input(const T&) { return Input::unsupported(); }

} // namespace vid
