#include "key_reader.hpp"
#include "key_pack.hpp"
#include "ecdh.hpp"
#include "glog_error.hpp"
#include "hex.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace glog {

// ── YAML parser ───────────────────────────────────────────────────────────────

static std::vector<uint8_t> decode_hex_yaml(const YAML::Node& node, const char* field) {
    try {
        return hex_decode(node.as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("YAML server key: '") + field + "' " + e.what());
    }
}

static ServerKey load_key_yaml(const std::string& path) {
    YAML::Node doc = YAML::LoadFile(path);

    // Validate document type discriminator
    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != "glog-server-key")
        throw std::runtime_error(
            "YAML server key: 'type' field must be 'glog-server-key' (got '" + doc_type + "')");

    ServerKey key;
    key.version = doc["version"].as<int>(1);
    key.alias   = doc["alias"].as<std::string>();
    key.curve   = doc["curve"].as<std::string>("secp256k1");
    key.id      = doc["id"].as<std::string>("");

    if (key.curve != "secp256k1")
        throw std::runtime_error("YAML server key: unsupported curve '" + key.curve + "'");

    if (doc["pk"]) key.pk = decode_hex_yaml(doc["pk"], "pk");
    if (!doc["sk"])
        throw std::runtime_error("YAML server key: missing 'sk'");
    key.sk = decode_hex_yaml(doc["sk"], "sk");

    key.kdf        = parse_kdf(doc["kdf"].as<std::string>("truncate"));
    key.continuity = parse_continuity(doc["cipher-continuity"].as<std::string>("session"));
    return key;
}

// ── Verification ──────────────────────────────────────────────────────────────

void verify_server_key(ServerKey& key, const std::string& origin) {
    if (key.sk.empty())
        throw std::runtime_error(origin + ": key holds no private scalar");

    std::vector<uint8_t> derived_pk;
    try {
        derived_pk = ecdh::public_key(key.sk);
    } catch (const CryptoError& e) {
        throw std::runtime_error(origin + ": " + e.what());
    }

    if (key.pk.empty())
        key.pk = derived_pk;
    else if (key.pk != derived_pk)
        throw std::runtime_error(origin + ": stored pk " + hex_encode(key.pk) +
                                 " does not match the private key");

    std::string derived_id = derive_key_id(key.pk);
    if (key.id.empty())
        key.id = derived_id;
    else if (key.id != derived_id)
        throw std::runtime_error(origin + ": key id mismatch: stored " + key.id +
                                 " but derived " + derived_id + " from public key");
}

// ── Entry point ───────────────────────────────────────────────────────────────

ServerKey load_server_key(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open key file: " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (bytes.empty())
        throw std::runtime_error("Key file is empty: " + path);

    std::string text(bytes.begin(), bytes.end());
    ServerKey key;
    if (is_hex_string(text, 2 * ecdh::kPrivateKeyLen)) {
        key.sk = hex_decode(text);
    } else if (bytes.size() == ecdh::kPrivateKeyLen) {
        key.sk = bytes;
    } else if (bytes[0] == 0x2D) {
        try {
            key = load_key_yaml(path);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(path + ": " + e.what());
        }
    } else {
        try {
            key = key_mp::unpack(bytes);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(path + ": not a server key (" + e.what() + ")");
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(path + ": " + e.what());
        }
    }

    verify_server_key(key, path);
    return key;
}

} // namespace glog
