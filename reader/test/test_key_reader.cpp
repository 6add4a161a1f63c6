#include "key_reader.hpp"
#include "key_yaml.hpp"
#include "key_pack.hpp"
#include "glog_reader.hpp"
#include "ecdh.hpp"
#include "hex.hpp"
#include "glog_writer.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace glog;

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

static bool load_fails(const std::string& path) {
    try {
        load_server_key(path);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

static bool same_key(const ServerKey& a, const ServerKey& b) {
    return a.alias == b.alias && a.id == b.id && a.pk == b.pk && a.sk == b.sk &&
           a.kdf == b.kdf && a.continuity == b.continuity;
}

// Replace the first occurrence of `from` in `s`.
static std::string replace_once(std::string s, const std::string& from, const std::string& to) {
    size_t at = s.find(from);
    if (at != std::string::npos) s.replace(at, from.size(), to);
    return s;
}

int main() {
    bool ok = true;
    const std::string path = "test_key_reader.key";

    ServerKey key = make_server_key("collector-1", KdfAlg::Shake256, CipherContinuity::PerFrame);
    ok &= check(key.id.size() == 32, "id is 16 bytes of hex");
    ok &= check(key.id == derive_key_id(key.pk), "id derived from pk");
    ok &= check(key.pk == ecdh::public_key(key.sk), "pk matches sk");

    // ── YAML ─────────────────────────────────────────────────────────────────
    std::string yaml = emit_key_yaml(key);
    ok &= check(yaml.compare(0, 3, "---") == 0, "YAML starts with a document marker");
    write_file(path, yaml);
    try {
        ServerKey loaded = load_server_key(path);
        ok &= check(same_key(loaded, key), "YAML round trip");
    } catch (const std::exception& e) {
        ok &= fail(std::string("YAML load threw: ") + e.what());
    }

    write_file(path, replace_once(yaml, key.id, std::string(32, '0')));
    ok &= check(load_fails(path), "YAML with wrong id rejected");

    ServerKey other = make_server_key("other");
    write_file(path, replace_once(yaml, hex_encode(key.pk), hex_encode(other.pk)));
    ok &= check(load_fails(path), "YAML with foreign pk rejected");

    write_file(path, replace_once(yaml, "glog-server-key", "glog-client-key"));
    ok &= check(load_fails(path), "YAML with wrong type rejected");

    write_file(path, replace_once(yaml, "shake256", "md5"));
    ok &= check(load_fails(path), "YAML with unknown kdf rejected");

    write_file(path, "---\ntype: glog-server-key\nalias: minimal\nsk: " + hex_encode(key.sk) + "\n");
    try {
        ServerKey loaded = load_server_key(path);
        ok &= check(loaded.pk == key.pk && loaded.id == key.id, "minimal YAML derives pk and id");
        ok &= check(loaded.kdf == KdfAlg::Truncate, "minimal YAML: default kdf");
        ok &= check(loaded.continuity == CipherContinuity::PerSession, "minimal YAML: default continuity");
    } catch (const std::exception& e) {
        ok &= fail(std::string("minimal YAML threw: ") + e.what());
    }

    // ── msgpack ──────────────────────────────────────────────────────────────
    key_mp::pack_to_file(key, path);
    try {
        ok &= check(same_key(load_server_key(path), key), "msgpack round trip");
    } catch (const std::exception& e) {
        ok &= fail(std::string("msgpack load threw: ") + e.what());
    }

    // ── Bare keys ────────────────────────────────────────────────────────────
    write_file(path, hex_encode(key.sk) + "\n");
    try {
        ServerKey loaded = load_server_key(path);
        ok &= check(loaded.sk == key.sk && loaded.pk == key.pk && loaded.id == key.id, "hex key file");
    } catch (const std::exception& e) {
        ok &= fail(std::string("hex key threw: ") + e.what());
    }

    write_file(path, std::string(key.sk.begin(), key.sk.end()));
    try {
        ok &= check(load_server_key(path).sk == key.sk, "raw 32-byte key file");
    } catch (const std::exception& e) {
        ok &= fail(std::string("raw key threw: ") + e.what());
    }

    write_file(path, std::string(32, '\0'));
    ok &= check(load_fails(path), "zero scalar rejected");

    write_file(path, "");
    ok &= check(load_fails(path), "empty file rejected");

    write_file(path, "not a key");
    ok &= check(load_fails(path), "unrecognised content rejected");

    std::remove(path.c_str());
    ok &= check(load_fails(path), "missing file rejected");

    // ── A loaded key opens its container ─────────────────────────────────────
    {
        using namespace glog_test;
        ecdh::KeyPair client = ecdh::keygen();
        WriterConfig cfg;
        cfg.version = FormatVersion::V4;
        cfg.encrypt = true;
        cfg.compress = true;
        cfg.iv.fill(0x5C);
        std::copy(client.pk.begin(), client.pk.end(), cfg.client_pk.begin());
        cfg.key = derive_session_key(key.kdf, ecdh::shared_secret(client.sk, key.pk.data(), key.pk.size()));
        cfg.continuity = key.continuity;

        GlogWriter w(cfg);
        std::vector<uint8_t> rec = make_text_record(200, 4);
        w.add(rec);
        w.add(rec);

        write_file(path, emit_key_yaml(key));
        ServerKey loaded = load_server_key(path);
        std::remove(path.c_str());

        ReaderOptions opts;
        opts.kdf = loaded.kdf;
        opts.continuity = loaded.continuity;
        GlogReader reader(std::make_unique<MemorySource>(w.bytes()), loaded.sk, opts);
        std::vector<uint8_t> out;
        ok &= check(reader.read(out).is_success() && out == rec, "key file decrypts record 0");
        ok &= check(reader.read(out).is_success() && out == rec, "key file decrypts record 1");
        ok &= check(reader.read(out).is_eof(), "key file: Eof");
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
