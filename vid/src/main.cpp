#include "authority.hpp"
#include "config.hpp"
#include "base32.hpp"
#include <openssl/rand.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " mint   --config <file> [--count <n>] [--hex]\n"
        "  " << prog << " verify --config <file> [--detail] <id>...\n"
        "  " << prog << " parse  --config <file> [--no-verify] <id>\n"
        "  " << prog << " secret [--bytes <n>]\n"
        "\n"
        "  --config     YAML file with keys, current-key-version and optional node-id\n"
        "  --count      Number of ids to mint (default 1)\n"
        "  --hex        Print the 18-byte binary as hex instead of base32\n"
        "  --detail     Append the failure reason to INVALID lines (diagnostics only)\n"
        "  --no-verify  Decode without checking the signature\n"
        "  --bytes      Secret length in bytes (default 32)\n"
        "\n"
        "  mint:   prints one id per line\n"
        "  verify: prints '<id> OK' or '<id> INVALID'; exit 0 only if all verify\n"
        "  parse:  prints the id metadata as YAML\n"
        "  secret: prints a random hex secret suitable for the keys map\n"
        "\n"
        "Exit codes: 0=ok, 1=usage/config, 2=crypto/verification, 3=I/O\n";
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static std::string hex_encode(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i)
        oss << std::setw(2) << static_cast<int>(data[i]);
    return oss.str();
}

// Loads the config and builds the Authority. Returns an exit code, 0 on success.
static int load_authority(const std::string& path, std::unique_ptr<vid::Authority>& out) {
    if (path.empty()) {
        std::cerr << "Error: --config is required\n";
        return 1;
    }

    vid::Config cfg;
    try {
        cfg = vid::load_config(path);
    } catch (const vid::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    try {
        out = std::make_unique<vid::Authority>(cfg);
    } catch (const vid::ConfigError& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

// ── mint command ──────────────────────────────────────────────────────────────

static int cmd_mint(int argc, char* argv[]) {
    std::string config_path;
    long count = 1;
    bool hex = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (std::strcmp(argv[i], "--count") == 0) {
            if (++i >= argc) { std::cerr << "Error: --count requires a value\n"; return 1; }
            char* end = nullptr;
            count = std::strtol(argv[i], &end, 10);
            if (!end || *end != '\0' || count < 1) {
                std::cerr << "Error: --count must be a positive integer\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--hex") == 0) {
            hex = true;
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    std::unique_ptr<vid::Authority> authority;
    if (int rc = load_authority(config_path, authority))
        return rc;

    try {
        for (long n = 0; n < count; ++n) {
            vid::Value id = authority->mint();
            if (hex) {
                vid::Binary b = id.to_binary();
                std::cout << hex_encode(b.data(), b.size()) << "\n";
            } else {
                std::cout << id << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: mint failed: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

// ── verify command ────────────────────────────────────────────────────────────

static int cmd_verify(int argc, char* argv[]) {
    std::string config_path;
    bool detail = false;
    std::vector<std::string> ids;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (std::strcmp(argv[i], "--detail") == 0) {
            detail = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else {
            ids.push_back(argv[i]);
        }
    }

    if (ids.empty()) {
        std::cerr << "Error: at least one id is required\n";
        return 1;
    }

    std::unique_ptr<vid::Authority> authority;
    if (int rc = load_authority(config_path, authority))
        return rc;

    bool all_ok = true;
    for (const auto& id : ids) {
        vid::VerifyResult r = authority->authenticate_detailed(id);
        std::cout << id << (r.valid ? " OK" : " INVALID");
        if (!r.valid && detail)
            std::cout << " " << vid::to_string(r.reason);
        std::cout << "\n";
        all_ok = all_ok && r.valid;
    }
    return all_ok ? 0 : 2;
}

// ── parse command ─────────────────────────────────────────────────────────────

static int cmd_parse(int argc, char* argv[]) {
    std::string config_path;
    std::string id;
    bool verify = true;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (++i >= argc) { std::cerr << "Error: --config requires a filename\n"; return 1; }
            config_path = argv[i];
        } else if (std::strcmp(argv[i], "--no-verify") == 0) {
            verify = false;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (id.empty()) {
            id = argv[i];
        } else {
            std::cerr << "Error: parse takes exactly one id\n";
            return 1;
        }
    }

    if (id.empty()) {
        std::cerr << "Error: an id is required\n";
        return 1;
    }

    std::unique_ptr<vid::Authority> authority;
    if (int rc = load_authority(config_path, authority))
        return rc;

    vid::DecodeOptions opts;
    opts.verify = verify;

    vid::Metadata m;
    try {
        m = authority->decode(id, opts);
    } catch (const vid::AuthenticationError&) {
        // Reason stays internal; use `verify --detail` to diagnose.
        std::cerr << "Error: id failed verification\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    YAML::Emitter out;
    out << YAML::BeginDoc;
    out << YAML::BeginMap;
    out << YAML::Key << "id"          << YAML::Value << vid::base32::normalize(id);
    out << YAML::Key << "key-version" << YAML::Value << (int)m.key_version;
    out << YAML::Key << "timestamp"   << YAML::Value << (unsigned long long)m.timestamp;
    out << YAML::Key << "iso"         << YAML::Value << m.iso;
    out << YAML::Key << "node-id"     << YAML::Value << (int)m.node_id;
    out << YAML::Key << "sequence"    << YAML::Value << (int)m.sequence;
    out << YAML::Key << "verified"    << YAML::Value << verify;
    out << YAML::EndMap;
    out << YAML::EndDoc;

    std::cout << out.c_str() << "\n";
    return 0;
}

// ── secret command ────────────────────────────────────────────────────────────

static int cmd_secret(int argc, char* argv[]) {
    long n_bytes = 32;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--bytes") == 0) {
            if (++i >= argc) { std::cerr << "Error: --bytes requires a value\n"; return 1; }
            char* end = nullptr;
            n_bytes = std::strtol(argv[i], &end, 10);
            if (!end || *end != '\0' || n_bytes < 16 || n_bytes > 1024) {
                std::cerr << "Error: --bytes must be between 16 and 1024\n";
                return 1;
            }
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        }
    }

    std::vector<uint8_t> secret((size_t)n_bytes);
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
        std::cerr << "Error: RAND_bytes failed\n";
        return 2;
    }
    std::cout << hex_encode(secret.data(), secret.size()) << "\n";
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "mint")   return cmd_mint(argc - 1, argv + 1);
    if (cmd == "verify") return cmd_verify(argc - 1, argv + 1);
    if (cmd == "parse")  return cmd_parse(argc - 1, argv + 1);
    if (cmd == "secret") return cmd_secret(argc - 1, argv + 1);

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}
