#include "kdf.hpp"
#include <openssl/evp.h>
#include <cstring>
#include <stdexcept>

extern "C" {
#include "SimpleFIPS202.h"
}

namespace glog {

static SessionKey kdf_truncate(const std::vector<uint8_t>& x) {
    SessionKey key;
    std::memcpy(key.data(), x.data(), key.size());
    return key;
}

static SessionKey kdf_sha256(const std::vector<uint8_t>& x) {
    uint8_t digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(x.data(), x.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1 ||
        digest_len < kSessionKeyLen)
        throw std::runtime_error("SHA-256 KDF failed");

    SessionKey key;
    std::memcpy(key.data(), digest, key.size());
    return key;
}

static SessionKey kdf_shake256(const std::vector<uint8_t>& x) {
    SessionKey key;
    if (SHAKE256(key.data(), key.size(), x.data(), x.size()) != 0)
        throw std::runtime_error("SHAKE256 KDF failed");
    return key;
}

SessionKey derive_session_key(KdfAlg alg, const std::vector<uint8_t>& shared_x) {
    if (shared_x.size() < kSessionKeyLen)
        throw std::invalid_argument("shared secret shorter than the session key");

    switch (alg) {
        case KdfAlg::Truncate: return kdf_truncate(shared_x);
        case KdfAlg::Sha256:   return kdf_sha256(shared_x);
        case KdfAlg::Shake256: return kdf_shake256(shared_x);
    }
    throw std::invalid_argument("Unknown KDF");
}

const char* kdf_name(KdfAlg alg) {
    switch (alg) {
        case KdfAlg::Truncate: return "truncate";
        case KdfAlg::Sha256:   return "sha256";
        case KdfAlg::Shake256: return "shake256";
    }
    return "unknown";
}

KdfAlg parse_kdf(const std::string& name) {
    if (name == "truncate") return KdfAlg::Truncate;
    if (name == "sha256")   return KdfAlg::Sha256;
    if (name == "shake256") return KdfAlg::Shake256;
    throw std::invalid_argument("Unknown KDF: " + name + " (truncate|sha256|shake256)");
}

} // namespace glog
