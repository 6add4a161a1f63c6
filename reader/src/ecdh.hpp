#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ecdh {

// secp256k1 only.
static constexpr size_t kPrivateKeyLen    = 32;   // big-endian scalar
static constexpr size_t kPublicKeyLen     = 33;   // compressed SEC1 point
static constexpr size_t kSharedSecretLen  = 32;   // affine x-coordinate

struct KeyPair {
    std::vector<uint8_t> pk;   // compressed
    std::vector<uint8_t> sk;
};

KeyPair keygen();

// Throws glog::CryptoError(InvalidPrivateKey) unless sk is 32 bytes in [1, n-1].
void check_private_key(const std::vector<uint8_t>& sk);

// Compressed public key for a private scalar.
std::vector<uint8_t> public_key(const std::vector<uint8_t>& sk);

// x-coordinate of sk * Q, where Q is the compressed point `pub`.
// Throws glog::CryptoError (InvalidPrivateKey, InvalidPublicKey).
std::vector<uint8_t> shared_secret(const std::vector<uint8_t>& sk,
                                   const uint8_t* pub, size_t pub_len);

} // namespace ecdh
