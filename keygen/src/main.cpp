#include "server_key.hpp"
#include "key_yaml.hpp"
#include "key_pack.hpp"
#include "hex.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <cstring>

using namespace glog;

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage: " << prog << " --alias <name>\n"
        "              [--out <file>]\n"
        "              [--kdf <truncate|sha256|shake256>]\n"
        "              [--cipher-continuity <session|frame>]\n"
        "\n"
        "  --alias              Name for this server key (required)\n"
        "  --out <file>         Write binary msgpack key to file; prints summary to stdout\n"
        "  --kdf                Shared-secret reduction recorded in the key (default: truncate)\n"
        "  --cipher-continuity  CFB register scope recorded in the key (default: session)\n"
        "\n"
        "Output (no --out): YAML to stdout. With --out: binary msgpack + summary to stdout.\n"
        "Producers embed the compressed public key (pk) shown in either form.\n";
}

static void print_summary(const ServerKey& key) {
    std::cout << "Server key generated:\n"
              << "  alias:  " << key.alias                      << "\n"
              << "  curve:  " << key.curve                      << "\n"
              << "  id:     " << key.id                         << "\n"
              << "  pk:     " << hex_encode(key.pk)             << "\n"
              << "  kdf:    " << kdf_name(key.kdf)              << "\n"
              << "  cipher: " << continuity_name(key.continuity) << "\n";
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    std::string alias;
    std::string out_file;
    std::string kdf_str = "truncate";
    std::string cc_str  = "session";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--alias") == 0) {
            if (++i >= argc) { std::cerr << "Error: --alias requires a value\n"; return 1; }
            alias = argv[i];
        } else if (std::strcmp(argv[i], "--out") == 0) {
            if (++i >= argc) { std::cerr << "Error: --out requires a filename\n"; return 1; }
            out_file = argv[i];
        } else if (std::strcmp(argv[i], "--kdf") == 0) {
            if (++i >= argc) { std::cerr << "Error: --kdf requires a value\n"; return 1; }
            kdf_str = argv[i];
        } else if (std::strcmp(argv[i], "--cipher-continuity") == 0) {
            if (++i >= argc) { std::cerr << "Error: --cipher-continuity requires a value\n"; return 1; }
            cc_str = argv[i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (alias.empty()) {
        std::cerr << "Error: --alias is required\n";
        return 1;
    }

    KdfAlg kdf;
    CipherContinuity cc;
    try {
        kdf = parse_kdf(kdf_str);
        cc  = parse_continuity(cc_str);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    ServerKey key;
    try {
        key = make_server_key(alias, kdf, cc);
    } catch (const std::exception& e) {
        std::cerr << "Error: crypto failure: " << e.what() << "\n";
        return 2;
    }

    if (!out_file.empty()) {
        try {
            key_mp::pack_to_file(key, out_file);
        } catch (const std::exception& e) {
            std::cerr << "Error: msgpack write failed: " << e.what() << "\n";
            return 3;
        }
        print_summary(key);
    } else {
        try {
            std::cout << emit_key_yaml(key);
        } catch (const std::exception& e) {
            std::cerr << "Error: YAML output failed: " << e.what() << "\n";
            return 3;
        }
    }

    return 0;
}
