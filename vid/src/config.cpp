#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace vid {

static int as_int(const YAML::Node& node, const std::string& field) {
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        throw ConfigError("config: '" + field + "' must be an integer (got '" +
                          node.Scalar() + "')");
    }
}

static Config config_from_node(const YAML::Node& doc) {
    if (!doc || !doc.IsMap())
        throw ConfigError("config: document must be a mapping");

    Config cfg;

    YAML::Node keys = doc["keys"];
    if (!keys)
        throw ConfigError("config: missing 'keys'");
    if (!keys.IsMap())
        throw ConfigError("config: 'keys' must map key versions to secrets");

    for (const auto& kv : keys) {
        int version = as_int(kv.first, "keys");
        if (!kv.second.IsScalar())
            throw ConfigError("config: secret for key version " + std::to_string(version) +
                              " must be a string");
        if (cfg.keys.count(version))
            throw ConfigError("config: duplicate key version " + std::to_string(version));
        cfg.keys[version] = kv.second.as<std::string>();
    }

    YAML::Node current = doc["current-key-version"];
    if (!current)
        throw ConfigError("config: missing 'current-key-version'");
    if (!current.IsScalar())
        throw ConfigError("config: 'current-key-version' must be an integer");
    cfg.current_key_version = as_int(current, "current-key-version");

    YAML::Node node = doc["node-id"];
    if (node && !node.IsNull()) {
        if (!node.IsScalar())
            throw ConfigError("config: 'node-id' must be an integer or a string");

        // Plain integers are numeric ids; anything else (including quoted
        // digits) is hashed as a string.
        long long n = 0;
        if (node.Tag() != "!" && YAML::convert<long long>::decode(node, n))
            cfg.node = NodeSeed::from_number(n);
        else
            cfg.node = NodeSeed::from_text(node.Scalar());
    }

    return cfg;
}

Config load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open config file: " + path);

    YAML::Node doc;
    try {
        doc = YAML::Load(f);
    } catch (const YAML::Exception& e) {
        throw ConfigError("config: " + path + ": " + e.what());
    }
    return config_from_node(doc);
}

Config parse_config(const std::string& yaml_text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }
    return config_from_node(doc);
}

} // namespace vid
