#include "crypto_session.hpp"
#include "glog_error.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <stdexcept>

namespace glog {

const char* continuity_name(CipherContinuity c) {
    return c == CipherContinuity::PerFrame ? "frame" : "session";
}

CipherContinuity parse_continuity(const std::string& name) {
    if (name == "session") return CipherContinuity::PerSession;
    if (name == "frame")   return CipherContinuity::PerFrame;
    throw std::invalid_argument("Unknown cipher continuity: " + name + " (session|frame)");
}

CryptoSession::CryptoSession(const SessionKey& key, const std::array<uint8_t, kIvLen>& iv,
                             CipherContinuity continuity)
    : key_(key), iv_(iv), continuity_(continuity)
{
    ctx_ = EVP_CIPHER_CTX_new();
    if (!ctx_) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    try {
        rearm();
    } catch (...) {
        EVP_CIPHER_CTX_free(ctx_);
        throw;
    }
}

CryptoSession::~CryptoSession() {
    EVP_CIPHER_CTX_free(ctx_);
    OPENSSL_cleanse(key_.data(), key_.size());
}

void CryptoSession::rearm() {
    if (EVP_DecryptInit_ex(ctx_, EVP_aes_128_cfb128(), nullptr, key_.data(), iv_.data()) != 1)
        throw CryptoError(CryptoErrc::DecryptFailed, "AES-128-CFB init failed");
    position_ = 0;
}

void CryptoSession::begin_frame() {
    if (continuity_ == CipherContinuity::PerFrame && position_ != 0)
        rearm();
}

void CryptoSession::decrypt(uint8_t* buf, size_t n) {
    if (n == 0) return;
    if (n > static_cast<size_t>(kMaxRawFrameLen))
        throw CryptoError(CryptoErrc::DecryptFailed,
            "ciphertext of " + std::to_string(n) + " bytes exceeds one frame");

    int out_len = 0;
    if (EVP_DecryptUpdate(ctx_, buf, &out_len, buf, static_cast<int>(n)) != 1 ||
        static_cast<size_t>(out_len) != n)
        throw CryptoError(CryptoErrc::DecryptFailed, "AES-128-CFB update failed");
    position_ += n;
}

} // namespace glog
