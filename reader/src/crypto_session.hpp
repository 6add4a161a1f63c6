#pragma once
#include "glog.hpp"
#include "kdf.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace glog {

// Whether the CFB feedback register survives frame boundaries.
enum class CipherContinuity {
    PerSession,   // one register for the whole stream
    PerFrame      // re-initialised from the header IV at each frame
};

const char* continuity_name(CipherContinuity c);
// Accepts "session", "frame"; throws std::invalid_argument otherwise.
CipherContinuity parse_continuity(const std::string& name);

// AES-128-CFB128 decryption state for one reader.
class CryptoSession {
public:
    CryptoSession(const SessionKey& key, const std::array<uint8_t, kIvLen>& iv,
                  CipherContinuity continuity);
    ~CryptoSession();

    CryptoSession(const CryptoSession&) = delete;
    CryptoSession& operator=(const CryptoSession&) = delete;

    // Call before each frame's bytes are decrypted.
    void begin_frame();

    // Decrypt in place. Throws CryptoError(DecryptFailed).
    void decrypt(uint8_t* buf, size_t n);

    CipherContinuity continuity() const { return continuity_; }
    // Bytes fed through the current register since it was last initialised.
    uint64_t position() const { return position_; }

private:
    void rearm();

    EVP_CIPHER_CTX*             ctx_ = nullptr;
    SessionKey                  key_;
    std::array<uint8_t, kIvLen> iv_;
    CipherContinuity            continuity_;
    uint64_t                    position_ = 0;
};

} // namespace glog
