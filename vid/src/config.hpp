#pragma once
#include "authority.hpp"
#include <string>

// YAML configuration:
//
//   keys:
//     1: "0123456789abcdef0123456789abcdef"
//     2: "fedcba9876543210fedcba9876543210"
//   current-key-version: 2
//   node-id: "pod-backend-7d9f"      # or 0-65535; optional
//
// Shape errors throw ConfigError naming the field. Value validation
// (secret length, version range, ...) is left to Authority.

namespace vid {

Config load_config(const std::string& path);
Config parse_config(const std::string& yaml_text);

} // namespace vid
