#include "key_pack.hpp"
#include <msgpack.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using glog::ServerKey;

namespace key_mp {

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw std::runtime_error(std::string(ctx) + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

static std::vector<uint8_t> require_bin(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::BIN)
        throw std::runtime_error(std::string(ctx) + ": expected binary");
    return {reinterpret_cast<const uint8_t*>(obj.via.bin.ptr),
            reinterpret_cast<const uint8_t*>(obj.via.bin.ptr) + obj.via.bin.size};
}

static void pack_bytes(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<uint8_t>& b) {
    pk.pack_bin(static_cast<uint32_t>(b.size()));
    pk.pack_bin_body(reinterpret_cast<const char*>(b.data()), b.size());
}

// ── pack ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack(const ServerKey& key) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    bool has_sk = !key.sk.empty();
    pk.pack_map(has_sk ? 8 : 7);

    pk.pack(std::string("v"));
    pk.pack_uint32(static_cast<uint32_t>(key.version));

    pk.pack(std::string("a"));
    pk.pack(key.alias);

    pk.pack(std::string("c"));
    pk.pack(key.curve);

    pk.pack(std::string("id"));
    pk.pack(key.id);

    pk.pack(std::string("pk"));
    pack_bytes(pk, key.pk);

    if (has_sk) {
        pk.pack(std::string("sk"));
        pack_bytes(pk, key.sk);
    }

    pk.pack(std::string("kdf"));
    pk.pack(std::string(glog::kdf_name(key.kdf)));

    pk.pack(std::string("cc"));
    pk.pack(std::string(glog::continuity_name(key.continuity)));

    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// ── unpack ────────────────────────────────────────────────────────────────────

ServerKey unpack(const std::vector<uint8_t>& data) {
    msgpack::object_handle oh = msgpack::unpack(
        reinterpret_cast<const char*>(data.data()), data.size());
    const msgpack::object& obj = oh.get();

    if (obj.type != msgpack::type::MAP)
        throw std::runtime_error("unpack: top-level object must be a map");

    ServerKey key;
    bool got_v = false, got_a = false, got_c = false, got_id = false, got_pk = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string name = require_str(kv.key, "map key");
        const msgpack::object& val = kv.val;

        if (name == "v") {
            if (val.type != msgpack::type::POSITIVE_INTEGER)
                throw std::runtime_error("unpack: 'v' must be unsigned int");
            key.version = static_cast<int>(val.via.u64);
            got_v = true;
        } else if (name == "a") {
            key.alias = require_str(val, "'a'");
            got_a = true;
        } else if (name == "c") {
            key.curve = require_str(val, "'c'");
            got_c = true;
        } else if (name == "id") {
            key.id = require_str(val, "'id'");
            got_id = true;
        } else if (name == "pk") {
            key.pk = require_bin(val, "'pk'");
            got_pk = true;
        } else if (name == "sk") {
            key.sk = require_bin(val, "'sk'");
        } else if (name == "kdf") {
            key.kdf = glog::parse_kdf(require_str(val, "'kdf'"));
        } else if (name == "cc") {
            key.continuity = glog::parse_continuity(require_str(val, "'cc'"));
        }
    }

    if (!got_v || !got_a || !got_c || !got_id || !got_pk)
        throw std::runtime_error("unpack: missing required fields in msgpack server key");
    if (key.curve != "secp256k1")
        throw std::runtime_error("unpack: unsupported curve '" + key.curve + "'");

    return key;
}

// ── file I/O ──────────────────────────────────────────────────────────────────

void pack_to_file(const ServerKey& key, const std::string& path) {
    auto bytes = pack(key);
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("pack_to_file: cannot open " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("pack_to_file: write error");
}

ServerKey unpack_from_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("unpack_from_file: cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw std::runtime_error("unpack_from_file: read error");
    return unpack(bytes);
}

} // namespace key_mp
