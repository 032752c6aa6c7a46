#include "value.hpp"
#include "base32.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

int main() {
    using namespace vid;
    bool ok = true;

    Binary b{};
    for (size_t i = 0; i < BINARY_BYTES; ++i)
        b[i] = (uint8_t)i;

    Value v(b);
    ok &= check(v.to_string() == "AAAQEAYEAUDAOCAJBIFQYDIOB4IBC", "text form");
    ok &= check(v.to_binary() == b, "binary form");
    ok &= check(v.key_version() == 0, "key_version");

    // Mutating a returned copy leaves the value untouched
    Binary copy = v.to_binary();
    copy[0] = 0xFF;
    ok &= check(v.to_binary()[0] == 0, "to_binary exposes internal buffer");
    ok &= check(v.key_version() == 0, "key_version changed through a copy");

    // Mutating the source after construction leaves the value untouched
    uint8_t raw[BINARY_BYTES];
    for (size_t i = 0; i < BINARY_BYTES; ++i)
        raw[i] = (uint8_t)i;
    Value w = Value::from_binary(raw, sizeof(raw));
    raw[5] = 0xEE;
    ok &= check(w == v, "from_binary did not copy");

    Value t = Value::from_string("  aaaqeayeaudaocajbifqydiob4ibc ");
    ok &= check(t == v, "from_string");
    ok &= check(t.to_string() == v.to_string(), "from_string text not canonical");

    std::ostringstream oss;
    oss << v;
    ok &= check(oss.str() == v.to_string(), "operator<<");

    Binary b2 = b;
    b2[10] = 0xFF;
    Value later(b2);
    ok &= check(v < later && !(later < v) && v != later, "ordering");

    bool threw = false;
    try { Value::from_binary(raw, 17); }
    catch (const std::invalid_argument&) { threw = true; }
    ok &= check(threw, "17 bytes accepted");

    threw = false;
    try { Value::from_binary(nullptr, 18); }
    catch (const std::invalid_argument&) { threw = true; }
    ok &= check(threw, "null buffer accepted");

    threw = false;
    try { Value::from_string("AAAQEAYEAUDAOCAJBIFQYDIOB4IB"); }
    catch (const base32::DecodeError&) { threw = true; }
    ok &= check(threw, "28 characters accepted");

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
