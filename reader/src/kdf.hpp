#pragma once
#include "glog.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace glog {

// Reduction of the 32-byte ECDH x-coordinate to an AES-128 key.
enum class KdfAlg {
    Truncate,   // first 16 bytes of x (what the producer does)
    Sha256,     // SHA-256(x)[0..16)
    Shake256    // SHAKE256(x, 16)
};

using SessionKey = std::array<uint8_t, kSessionKeyLen>;

SessionKey derive_session_key(KdfAlg alg, const std::vector<uint8_t>& shared_x);

const char* kdf_name(KdfAlg alg);
// Accepts "truncate", "sha256", "shake256"; throws std::invalid_argument otherwise.
KdfAlg parse_kdf(const std::string& name);

} // namespace glog
