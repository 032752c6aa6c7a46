#include "node_identity.hpp"
#include "kdf.hpp"
#include <openssl/rand.h>
#include <cstdlib>
#include <stdexcept>

namespace vid::node {

static std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

Environment process_environment() {
    return [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

RandomU16 secure_random() {
    return [] {
        uint8_t buf[2];
        if (RAND_bytes(buf, 2) != 1)
            throw std::runtime_error("RAND_bytes failed");
        return (uint16_t)(((uint16_t)buf[0] << 8) | buf[1]);
    };
}

uint16_t from_number(long long value) {
    if (value < 0 || value > (long long)MAX_NODE_ID)
        throw ConfigError("node id must be an integer between 0 and " +
                          std::to_string(MAX_NODE_ID) + " (got " + std::to_string(value) + ")");
    return (uint16_t)value;
}

uint16_t from_text(const std::string& value) {
    std::string t = trim(value);
    if (t.empty())
        throw ConfigError("node id string must not be empty; provide a non-empty "
                          "string or a number 0-" + std::to_string(MAX_NODE_ID));
    return kdf::hash_to_u16(t);
}

// Non-empty trimmed value of an environment variable, if any.
static std::optional<std::string> env_value(const Environment& env, const char* name) {
    if (!env) return std::nullopt;
    std::optional<std::string> v = env(name);
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

NodeResolution resolve(const NodeSeed& seed, const Environment& env, const RandomU16& random) {
    NodeResolution r;

    switch (seed.kind) {
        case NodeSeed::Kind::Number:
            r.node_id = from_number(seed.number);
            r.source  = NodeSource::ExplicitNumber;
            return r;
        case NodeSeed::Kind::Text:
            r.node_id = from_text(seed.text);
            r.source  = NodeSource::ExplicitString;
            return r;
        case NodeSeed::Kind::None:
            break;
    }

    if (auto pod_ip = env_value(env, "POD_IP")) {
        r.node_id = kdf::hash_to_u16(*pod_ip);
        r.source  = NodeSource::PodIp;
        return r;
    }

    if (auto hostname = env_value(env, "HOSTNAME")) {
        r.node_id = kdf::hash_to_u16(*hostname);
        r.source  = NodeSource::Hostname;
        return r;
    }

    r.node_id = random ? random() : secure_random()();
    r.source  = NodeSource::Random;
    r.warning = "node id randomly assigned (node_id=" + std::to_string(r.node_id) +
                "); safe for single-instance use only, distributed deployments risk "
                "id collisions. Set POD_IP or HOSTNAME, or configure node-id explicitly.";
    return r;
}

} // namespace vid::node
