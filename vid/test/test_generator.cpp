#include "generator.hpp"
#include "byte_codec.hpp"
#include "kdf.hpp"
#include <iostream>
#include <memory>
#include <set>
#include <utility>
#include <vector>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static vid::PayloadFields fields(const vid::Value& v) {
    vid::Binary b = v.to_binary();
    return vid::bytes::decode_payload(b.data(), b.size());
}

// Replays a list of timestamps, repeating the last one forever.
static vid::Clock scripted_clock(std::vector<uint64_t> times) {
    auto idx = std::make_shared<size_t>(0);
    return [times, idx] {
        size_t i = *idx < times.size() ? *idx : times.size() - 1;
        ++*idx;
        return times[i];
    };
}

int main() {
    using namespace vid;
    bool ok = true;

    const Secret secret = kdf::derive_key("0123456789abcdef0123456789abcdef");
    const uint64_t T = 1700000000000ULL;

    // Same millisecond: sequence counts up, everything else fixed
    {
        GeneratorOptions opts;
        opts.clock = fixed_clock(T);
        Generator g(0x6657, opts);

        Value a = g.mint(1, secret);
        Value b = g.mint(1, secret);
        PayloadFields fa = fields(a), fb = fields(b);
        ok &= check(fa.timestamp == T && fb.timestamp == T, "timestamp");
        ok &= check(fa.sequence == 0 && fb.sequence == 1, "sequence 0 then 1");
        ok &= check(fa.node_id == 0x6657 && fa.key_version == 1, "node/key");
        ok &= check(a.to_string() == "AEAYXT7FNAAGMVYAAAA4QNF3G3Y2Y", "first id text");
        ok &= check(b.to_string() == "AEAYXT7FNAAGMVYAAGMVFVCP4GEBI", "second id text");
        ok &= check(g.last_timestamp() == T && g.sequence() == 1, "generator state");
    }

    // Monotonic: binary order equals mint order, across ms boundaries
    {
        GeneratorOptions opts;
        opts.clock = scripted_clock({ T, T, T + 1, T + 1, T + 1, T + 5, T + 9 });
        Generator g(3, opts);
        std::vector<Value> ids;
        for (int i = 0; i < 7; ++i)
            ids.push_back(g.mint(0, secret));

        bool ordered = true;
        for (size_t i = 1; i < ids.size(); ++i)
            ordered = ordered && ids[i - 1] < ids[i];
        ok &= check(ordered, "ids not strictly increasing");
        ok &= check(fields(ids[2]).sequence == 0, "sequence not reset on new ms");
    }

    // Clock regression: timestamp held, sequence keeps counting
    {
        GeneratorOptions opts;
        opts.clock = scripted_clock({ T + 10, T + 3, T + 4, T + 11 });
        Generator g(3, opts);
        Value a = g.mint(0, secret);
        Value b = g.mint(0, secret);
        Value c = g.mint(0, secret);
        Value d = g.mint(0, secret);
        ok &= check(fields(b).timestamp == T + 10 && fields(b).sequence == 1, "regression not clamped");
        ok &= check(fields(c).timestamp == T + 10 && fields(c).sequence == 2, "regression sequence");
        ok &= check(fields(d).timestamp == T + 11 && fields(d).sequence == 0, "recovery");
        ok &= check(a < b && b < c && c < d, "regression broke ordering");
    }

    // Sequence overflow: 65 537 mints in one ms wait exactly once
    {
        auto calls = std::make_shared<uint64_t>(0);
        GeneratorOptions opts;
        opts.clock = [calls, T] { return ++*calls <= 65537 ? T : T + 1; };
        Generator g(9, opts);

        std::set<std::pair<uint64_t, uint16_t>> seen;
        bool unique = true;
        Value last(Binary{});
        for (int i = 0; i < 65537; ++i) {
            last = g.mint(0, secret);
            PayloadFields f = fields(last);
            unique = unique && seen.insert({ f.timestamp, f.sequence }).second;
        }
        ok &= check(unique, "duplicate (timestamp, sequence)");
        ok &= check(g.overflow_waits() == 1, "overflow did not wait exactly once");
        ok &= check(fields(last).timestamp == T + 1 && fields(last).sequence == 0,
                    "post-overflow id not at next tick");
    }

    // Clock frozen through an overflow: bounded wait, then ClockFault
    {
        GeneratorOptions opts;
        opts.clock = fixed_clock(T);
        opts.max_clock_wait = std::chrono::milliseconds(20);
        Generator g(9, opts);
        for (int i = 0; i < 65536; ++i)
            g.mint(0, secret);

        bool threw = false;
        try { g.mint(0, secret); }
        catch (const ClockFault&) { threw = true; }
        ok &= check(threw, "frozen clock did not raise ClockFault");
    }

    // Past 2^48 - 1
    {
        GeneratorOptions opts;
        opts.clock = fixed_clock(MAX_TIMESTAMP + 1);
        Generator g(1, opts);
        bool threw = false;
        try { g.mint(0, secret); }
        catch (const TimestampOverflow&) { threw = true; }
        ok &= check(threw, "49-bit timestamp minted");
    }

    // Short secret is rejected before any state change
    {
        GeneratorOptions opts;
        opts.clock = fixed_clock(T);
        Generator g(1, opts);
        std::vector<uint8_t> short_secret(16, 0x42);
        bool threw = false;
        try { g.mint(0, short_secret); }
        catch (const ConfigError&) { threw = true; }
        ok &= check(threw, "16-byte secret accepted");
        ok &= check(g.last_timestamp() == 0 && g.sequence() == 0, "state touched by rejected mint");

        std::vector<uint8_t> long_secret(secret.begin(), secret.end());
        Value v = g.mint(1, long_secret);
        ok &= check(fields(v).timestamp == T && fields(v).sequence == 0,
                    "vector secret overload");
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
