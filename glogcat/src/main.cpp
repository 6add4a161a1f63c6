#include "glog_reader.hpp"
#include "glog_error.hpp"
#include "key_reader.hpp"
#include "ecdh.hpp"
#include "hex.hpp"

#include <iostream>
#include <memory>
#include <vector>
#include <string>
#include <cstring>
#include <cstdio>
#include <cstdint>
#include <stdexcept>
#include <utility>

using namespace glog;

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " [--key <hex> | --keyfile <file>] [--kdf K] [--cipher-continuity C]\n"
        "  " << std::string(std::strlen(prog), ' ') << " [--format hex|raw] [--verbose] <log-file | ->\n"
        "\n"
        "  --key                Server private key, 64 hex characters\n"
        "  --keyfile            Server key file (YAML, msgpack, hex or raw; auto-detected)\n"
        "  --kdf                truncate (default) | sha256 | shake256\n"
        "  --cipher-continuity  session (default) | frame\n"
        "  --format             hex: index<TAB>length<TAB>hex per record (default)\n"
        "                       raw: u32 LE length + record bytes, for a schema decoder\n"
        "  --verbose            Header details and recovery events on stderr\n"
        "\n"
        "A key is needed only for encrypted (V4) containers.\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto, 3=I/O or format\n";
}

// ── Output ────────────────────────────────────────────────────────────────────

enum class OutputFormat { Hex, Raw };

static void emit_record(OutputFormat fmt, uint64_t index, const std::vector<uint8_t>& rec) {
    if (fmt == OutputFormat::Hex) {
        std::cout << index << '\t' << rec.size() << '\t' << hex_encode(rec) << '\n';
        return;
    }
    uint32_t n = static_cast<uint32_t>(rec.size());
    const char len_le[4] = {
        static_cast<char>( n        & 0xFF),
        static_cast<char>((n >>  8) & 0xFF),
        static_cast<char>((n >> 16) & 0xFF),
        static_cast<char>((n >> 24) & 0xFF),
    };
    std::cout.write(len_le, 4);
    std::cout.write(reinterpret_cast<const char*>(rec.data()),
                    static_cast<std::streamsize>(rec.size()));
}

static void print_header(const GlogReader& reader, const std::string& key_id) {
    const ContainerHeader& h = reader.header();
    char mode[8];
    std::snprintf(mode, sizeof(mode), "0x%02x", h.mode.raw);

    std::cerr << "glog " << version_name(h.version) << "\n"
              << "  proto:      " << (h.proto_name.empty() ? "(none)" : h.proto_name) << "\n"
              << "  mode:       " << mode
              << (h.compressed() ? " compressed" : "")
              << (h.encrypted() ? " encrypted" : "") << "\n"
              << "  header:     " << h.header_len << " bytes\n";
    if (h.encrypted()) {
        std::cerr << "  client pk:  " << hex_encode(h.client_public_key.data(), h.client_public_key.size()) << "\n"
                  << "  iv:         " << hex_encode(h.iv.data(), h.iv.size()) << "\n"
                  << "  server key: " << key_id << "\n"
                  << "  kdf:        " << kdf_name(reader.options().kdf) << "\n"
                  << "  cipher:     " << continuity_name(reader.options().continuity) << "\n";
    }
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    std::string key_hex;
    std::string key_path;
    std::string kdf_str;
    std::string cc_str;
    std::string target_path;
    OutputFormat fmt = OutputFormat::Hex;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--key") == 0) {
            if (++i >= argc) { std::cerr << "Error: --key requires a value\n"; return 1; }
            key_hex = argv[i];
        } else if (std::strcmp(argv[i], "--keyfile") == 0) {
            if (++i >= argc) { std::cerr << "Error: --keyfile requires a filename\n"; return 1; }
            key_path = argv[i];
        } else if (std::strcmp(argv[i], "--kdf") == 0) {
            if (++i >= argc) { std::cerr << "Error: --kdf requires a value\n"; return 1; }
            kdf_str = argv[i];
        } else if (std::strcmp(argv[i], "--cipher-continuity") == 0) {
            if (++i >= argc) { std::cerr << "Error: --cipher-continuity requires a value\n"; return 1; }
            cc_str = argv[i];
        } else if (std::strcmp(argv[i], "--format") == 0) {
            if (++i >= argc) { std::cerr << "Error: --format requires a value\n"; return 1; }
            std::string v = argv[i];
            if (v == "hex") {
                fmt = OutputFormat::Hex;
            } else if (v == "raw") {
                fmt = OutputFormat::Raw;
            } else {
                std::cerr << "Error: unknown --format value '" << v << "' (must be hex or raw)\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: unknown option '" << argv[i] << "'\n";
            return 1;
        } else {
            if (!target_path.empty()) {
                std::cerr << "Error: unexpected argument '" << argv[i] << "'\n";
                return 1;
            }
            target_path = argv[i];
        }
    }

    if (target_path.empty()) {
        std::cerr << "Error: <log-file> is required\n";
        print_usage(argv[0]);
        return 1;
    }
    if (!key_hex.empty() && !key_path.empty()) {
        std::cerr << "Error: --key and --keyfile are mutually exclusive\n";
        return 1;
    }

    // Key material and decoding options; explicit flags win over the key file
    ReaderOptions opts;
    std::vector<uint8_t> sk;
    std::string key_id = "(none)";

    if (!key_path.empty()) {
        ServerKey key;
        try {
            key = load_server_key(key_path);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot load key: " << e.what() << "\n";
            return 2;
        }
        sk = key.sk;
        key_id = key.id;
        opts.kdf = key.kdf;
        opts.continuity = key.continuity;
    } else if (!key_hex.empty()) {
        try {
            sk = private_key_from_string(key_hex);
            key_id = derive_key_id(ecdh::public_key(sk));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 2;
        }
    }

    try {
        if (!kdf_str.empty()) opts.kdf = parse_kdf(kdf_str);
        if (!cc_str.empty())  opts.continuity = parse_continuity(cc_str);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Open
    std::unique_ptr<GlogReader> reader;
    try {
        std::unique_ptr<ByteSource> src;
        if (target_path == "-")
            src = std::make_unique<IstreamSource>(std::cin);
        else
            src = std::make_unique<FileSource>(target_path);
        reader = std::make_unique<GlogReader>(std::move(src), sk, opts);
    } catch (const CryptoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    if (verbose)
        print_header(*reader, key_id);

    // Drain
    std::vector<uint8_t> rec;
    uint64_t records = 0;
    try {
        for (;;) {
            ReadResult r = reader->read(rec);
            if (r.is_eof())
                break;
            if (r.is_need_recover()) {
                if (verbose) {
                    const RecoverEvent& ev = reader->last_recover();
                    std::cerr << "recover: " << recover_code_name(ev.code)
                              << " (" << static_cast<int32_t>(ev.code) << ")"
                              << " at offset " << ev.corrupt_at
                              << ", resumed at " << ev.resumed_at << "\n";
                }
                continue;
            }
            emit_record(fmt, records++, rec);
        }
    } catch (const CryptoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: at offset " << reader->position() << ": " << e.what() << "\n";
        return 3;
    }

    std::cout.flush();
    if (!std::cout) {
        std::cerr << "Error: write to stdout failed\n";
        return 3;
    }

    if (verbose)
        std::cerr << records << " record(s), " << reader->recover_count() << " recovery event(s)\n";
    return 0;
}
