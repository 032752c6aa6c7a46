#pragma once
#include "vid.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// Unpadded RFC 4648 base32 (alphabet A-Z 2-7), fixed to the 18-byte binary.
// 18 bytes = 144 bits -> 29 chars; the final char carries 1 bit of zero padding.

namespace vid::base32 {

class DecodeError : public std::invalid_argument {
public:
    enum class Kind { Length, Character, Internal };

    static constexpr size_t npos = (size_t)-1;

    DecodeError(Kind kind, size_t position, const std::string& what)
        : std::invalid_argument(what), kind_(kind), position_(position) {}

    Kind   kind()     const { return kind_; }
    size_t position() const { return position_; }  // 0-based, npos unless Kind::Character

private:
    Kind   kind_;
    size_t position_;
};

// Encode exactly BINARY_BYTES bytes. Throws std::invalid_argument otherwise.
std::string encode(const uint8_t* data, size_t len);
std::string encode(const Binary& binary);

// Trim surrounding ASCII whitespace, upper-case, then decode.
// Throws DecodeError on wrong length or a character outside the alphabet.
//
// The low bit of the 29th character is padding and is discarded, so the two
// texts differing only in that bit (e.g. ...Y and ...Z) decode to the same
// bytes. encode(decode(s)) == s only when that bit is zero; callers that
// need a canonical text form should re-encode.
Binary decode(std::string_view text);

// Value (0-31) of an upper-case alphabet char, -1 otherwise.
int char_value(char c);

// Trimmed + upper-cased copy of text.
std::string normalize(std::string_view text);

// True if every char of (already normalized) text is in the alphabet.
bool all_in_alphabet(std::string_view text);

} // namespace vid::base32
