#include "key_pack.hpp"
#include <msgpack.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using glog::ServerKey;

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool unpack_fails(const std::vector<uint8_t>& bytes) {
    try {
        key_mp::unpack(bytes);
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

int main() {
    // Mock key with recognisable fill patterns
    ServerKey k;
    k.version    = 1;
    k.alias      = "collector";
    k.id         = "00112233445566778899aabbccddeeff";
    k.pk         = std::vector<uint8_t>(33, 0xAA);
    k.pk[0]      = 0x02;
    k.sk         = std::vector<uint8_t>(32, 0xBB);
    k.kdf        = glog::KdfAlg::Sha256;
    k.continuity = glog::CipherContinuity::PerFrame;

    std::vector<uint8_t> packed = key_mp::pack(k);
    std::cout << "Packed size: " << packed.size() << " bytes\n";

    ServerKey u;
    try {
        u = key_mp::unpack(packed);
    } catch (const std::exception& e) {
        std::cerr << "FAIL: unpack threw: " << e.what() << "\n";
        return 1;
    }

    bool ok = true;
    ok &= check(u.version    == k.version,    "version mismatch");
    ok &= check(u.alias      == k.alias,      "alias mismatch");
    ok &= check(u.curve      == "secp256k1",  "curve mismatch");
    ok &= check(u.id         == k.id,         "id mismatch");
    ok &= check(u.pk         == k.pk,         "pk mismatch");
    ok &= check(u.sk         == k.sk,         "sk mismatch");
    ok &= check(u.kdf        == k.kdf,        "kdf mismatch");
    ok &= check(u.continuity == k.continuity, "continuity mismatch");

    // Public-only copy keeps everything but the scalar
    ServerKey pub = k;
    pub.sk.clear();
    try {
        ServerKey up = key_mp::unpack(key_mp::pack(pub));
        ok &= check(up.sk.empty(), "public copy: sk absent");
        ok &= check(up.pk == k.pk, "public copy: pk kept");
    } catch (const std::exception& e) {
        std::cerr << "FAIL: public unpack threw: " << e.what() << "\n";
        ok = false;
    }

    // Missing required field
    {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_map(2);
        pk.pack(std::string("v"));
        pk.pack_uint32(1);
        pk.pack(std::string("a"));
        pk.pack(std::string("x"));
        std::vector<uint8_t> bytes(buf.data(), buf.data() + buf.size());
        ok &= check(unpack_fails(bytes), "missing fields rejected");
    }

    // Not a map
    {
        msgpack::sbuffer buf;
        msgpack::pack(buf, std::string("glog"));
        std::vector<uint8_t> bytes(buf.data(), buf.data() + buf.size());
        ok &= check(unpack_fails(bytes), "non-map rejected");
    }

    // Other curves are refused
    {
        ServerKey p = k;
        p.curve = "prime256v1";
        ok &= check(unpack_fails(key_mp::pack(p)), "foreign curve rejected");
    }

    // pk stored as a string instead of binary
    {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_map(5);
        pk.pack(std::string("v"));
        pk.pack_uint32(1);
        pk.pack(std::string("a"));
        pk.pack(k.alias);
        pk.pack(std::string("c"));
        pk.pack(std::string("secp256k1"));
        pk.pack(std::string("id"));
        pk.pack(k.id);
        pk.pack(std::string("pk"));
        pk.pack(std::string(k.pk.begin(), k.pk.end()));
        std::vector<uint8_t> bytes(buf.data(), buf.data() + buf.size());
        ok &= check(unpack_fails(bytes), "pk of wrong type rejected");
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
