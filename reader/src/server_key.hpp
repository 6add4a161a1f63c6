#pragma once
#include "kdf.hpp"
#include "crypto_session.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace glog {

// secp256k1 key pair held by the log collector, plus the decoding options
// producers agreed on for it.
struct ServerKey {
    int version = 1;
    std::string alias;
    std::string curve = "secp256k1";
    std::string id;                 // derive_key_id(pk)
    std::vector<uint8_t> pk;        // compressed, 33 bytes
    std::vector<uint8_t> sk;        // 32-byte scalar
    KdfAlg           kdf        = KdfAlg::Truncate;
    CipherContinuity continuity = CipherContinuity::PerSession;
};

// Generate a fresh key with its id filled in.
ServerKey make_server_key(const std::string& alias,
                          KdfAlg kdf = KdfAlg::Truncate,
                          CipherContinuity continuity = CipherContinuity::PerSession);

// BLAKE3 derive-key digest of the compressed public key, 16 bytes as hex.
std::string derive_key_id(const std::vector<uint8_t>& pk);

} // namespace glog
