#pragma once
// Test-only producer of Glog containers.
#include "glog.hpp"
#include "kdf.hpp"
#include "crypto_session.hpp"
#include <openssl/evp.h>
#include <zlib.h>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace glog_test {

using namespace glog;

struct WriterConfig {
    FormatVersion version    = FormatVersion::V3;
    std::string   proto_name = "LogProto";
    bool          compress   = false;
    bool          encrypt    = false;      // V4 only
    uint8_t       extra_mode = 0;          // reserved bits to set as well
    bool          independent_streams = false;   // one zlib stream per record

    std::array<uint8_t, kIvLen>           iv{};
    std::array<uint8_t, kClientPubKeyLen> client_pk{};
    SessionKey                            key{};
    CipherContinuity continuity = CipherContinuity::PerSession;
};

inline void put_u16le(std::vector<uint8_t>& out, size_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

inline uint8_t mode_byte(const WriterConfig& cfg) {
    uint8_t m = cfg.extra_mode;
    if (cfg.version == FormatVersion::V4) m |= 0x11;
    if (cfg.compress) m |= ModeSet::compressed_bit(cfg.version);
    if (cfg.encrypt)  m |= ModeSet::encrypted_bit(cfg.version);
    return m;
}

inline std::vector<uint8_t> build_header(const WriterConfig& cfg) {
    std::vector<uint8_t> h(kMagic.begin(), kMagic.end());
    h.push_back(static_cast<uint8_t>(cfg.version));
    if (cfg.version == FormatVersion::V3)
        h.push_back(mode_byte(cfg));
    put_u16le(h, cfg.proto_name.size());
    h.insert(h.end(), cfg.proto_name.begin(), cfg.proto_name.end());
    h.insert(h.end(), kSyncMarker.begin(), kSyncMarker.end());
    if (cfg.version == FormatVersion::V4) {
        h.push_back(mode_byte(cfg));
        if (cfg.encrypt) {
            h.insert(h.end(), cfg.iv.begin(), cfg.iv.end());
            h.insert(h.end(), cfg.client_pk.begin(), cfg.client_pk.end());
        }
    }
    return h;
}

// length | payload | marker
inline std::vector<uint8_t> build_frame(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> f;
    put_u16le(f, payload.size());
    f.insert(f.end(), payload.begin(), payload.end());
    f.insert(f.end(), kSyncMarker.begin(), kSyncMarker.end());
    return f;
}

// Compresses (one deflate stream sync-flushed per record, or one stream per
// record) and then encrypts, the way the producer does.
class GlogWriter {
public:
    explicit GlogWriter(const WriterConfig& cfg) : cfg_(cfg), bytes_(build_header(cfg)) {
        if (cfg_.compress && !cfg_.independent_streams) {
            zs_.zalloc = Z_NULL;
            zs_.zfree  = Z_NULL;
            zs_.opaque = Z_NULL;
            if (deflateInit(&zs_, Z_DEFAULT_COMPRESSION) != Z_OK)
                throw std::runtime_error("deflateInit failed");
            deflating_ = true;
        }
        if (cfg_.encrypt) {
            ctx_ = EVP_CIPHER_CTX_new();
            if (!ctx_) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
            rearm();
        }
    }
    ~GlogWriter() {
        if (deflating_) deflateEnd(&zs_);
        EVP_CIPHER_CTX_free(ctx_);
    }
    GlogWriter(const GlogWriter&) = delete;
    GlogWriter& operator=(const GlogWriter&) = delete;

    size_t header_len() const { return build_header(cfg_).size(); }

    // Returns the offset of the new frame.
    size_t add(const std::vector<uint8_t>& record) {
        std::vector<uint8_t> payload = cfg_.compress ? deflate_record(record) : record;
        if (cfg_.encrypt) encrypt(payload);
        return append_payload(payload);
    }

    // Append a frame around an already encoded payload.
    size_t append_payload(const std::vector<uint8_t>& payload) {
        if (payload.size() > kMaxRawFrameLen)
            throw std::runtime_error("payload too large for one frame");
        size_t off = bytes_.size();
        std::vector<uint8_t> f = build_frame(payload);
        bytes_.insert(bytes_.end(), f.begin(), f.end());
        return off;
    }

    void append_raw(const std::vector<uint8_t>& junk) {
        bytes_.insert(bytes_.end(), junk.begin(), junk.end());
    }

    std::vector<uint8_t>& bytes() { return bytes_; }

private:
    std::vector<uint8_t> deflate_record(const std::vector<uint8_t>& record) {
        if (cfg_.independent_streams) {
            uLongf len = compressBound(static_cast<uLong>(record.size()));
            std::vector<uint8_t> out(len);
            if (compress2(out.data(), &len, record.data(), static_cast<uLong>(record.size()),
                          Z_BEST_COMPRESSION) != Z_OK)
                throw std::runtime_error("compress2 failed");
            out.resize(len);
            return out;
        }

        std::vector<uint8_t> out;
        uint8_t chunk[4096];
        zs_.next_in  = const_cast<Bytef*>(record.data());
        zs_.avail_in = static_cast<uInt>(record.size());
        do {
            zs_.next_out  = chunk;
            zs_.avail_out = sizeof(chunk);
            int rc = deflate(&zs_, Z_SYNC_FLUSH);
            // Z_BUF_ERROR: nothing new to flush (empty record after a flush)
            if (rc != Z_OK && rc != Z_BUF_ERROR)
                throw std::runtime_error("deflate failed");
            out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs_.avail_out));
        } while (zs_.avail_out == 0);
        return out;
    }

    void rearm() {
        if (EVP_EncryptInit_ex(ctx_, EVP_aes_128_cfb128(), nullptr,
                               cfg_.key.data(), cfg_.iv.data()) != 1)
            throw std::runtime_error("AES-128-CFB encrypt init failed");
    }

    void encrypt(std::vector<uint8_t>& buf) {
        if (cfg_.continuity == CipherContinuity::PerFrame) rearm();
        if (buf.empty()) return;
        int len = 0;
        if (EVP_EncryptUpdate(ctx_, buf.data(), &len, buf.data(), static_cast<int>(buf.size())) != 1)
            throw std::runtime_error("AES-128-CFB encrypt failed");
    }

    WriterConfig         cfg_;
    std::vector<uint8_t> bytes_;
    z_stream             zs_{};
    bool                 deflating_ = false;
    EVP_CIPHER_CTX*      ctx_ = nullptr;
};

// Deterministic filler so records differ from each other.
inline std::vector<uint8_t> make_record(size_t len, uint8_t seed) {
    std::vector<uint8_t> r(len);
    uint32_t x = 0x9E3779B9u ^ seed;
    for (size_t i = 0; i < len; ++i) {
        x = x * 1103515245u + 12345u;
        r[i] = static_cast<uint8_t>(x >> 16);
    }
    return r;
}

// Text-like record that deflates well.
inline std::vector<uint8_t> make_text_record(size_t len, uint8_t seed) {
    static const char kWords[] = "glog record payload field value ";
    std::vector<uint8_t> r(len);
    for (size_t i = 0; i < len; ++i)
        r[i] = static_cast<uint8_t>(kWords[(i + seed) % (sizeof(kWords) - 1)]);
    return r;
}

} // namespace glog_test
