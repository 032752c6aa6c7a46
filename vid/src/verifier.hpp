#pragma once
#include "vid.hpp"
#include "input.hpp"
#include "key_set.hpp"

// Stateless authentication of identifiers against a key set.
// Never throws: every malformed input maps to false / a VerifyFailure.

namespace vid::verifier {

VerifyResult verify_detailed(const Input& input, const KeySet& keys) noexcept;
bool         verify(const Input& input, const KeySet& keys) noexcept;

template <typename T>
VerifyResult verify_detailed(const T& input, const KeySet& keys) noexcept {
    return verify_detailed(make_input(input), keys);
}

template <typename T>
bool verify(const T& input, const KeySet& keys) noexcept {
    return verify(make_input(input), keys);
}

} // namespace vid::verifier
