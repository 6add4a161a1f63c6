#include "glog_reader.hpp"
#include "glog_error.hpp"
#include "header_parser.hpp"
#include "ecdh.hpp"
#include "hex.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace glog {

GlogReader::GlogReader(std::unique_ptr<ByteSource> source,
                       const std::vector<uint8_t>& private_key,
                       ReaderOptions options)
    : cursor_(std::move(source)),
      header_(parse_header(cursor_)),
      scanner_(cursor_, header_.sync_marker),
      inflater_(header_.compressed()),
      options_(options)
{
    if (!header_.encrypted()) return;

    if (private_key.empty())
        throw CryptoError(CryptoErrc::MissingKey,
            "container is encrypted but no private key was supplied");

    std::vector<uint8_t> x = ecdh::shared_secret(private_key,
                                                 header_.client_public_key.data(),
                                                 header_.client_public_key.size());
    SessionKey key = derive_session_key(options_.kdf, x);
    OPENSSL_cleanse(x.data(), x.size());

    crypto_ = std::make_unique<CryptoSession>(key, header_.iv, options_.continuity);
    OPENSSL_cleanse(key.data(), key.size());
}

ReadResult GlogReader::read(uint8_t* buf, size_t capacity) {
    if (state_ == State::Failed)
        throw std::logic_error("GlogReader: read after a fatal error");
    if (state_ == State::Eof)
        return ReadResult::eof();
    state_ = State::Streaming;

    try {
        ScanOutcome o = scanner_.next(frame_);

        if (o.kind == ScanOutcome::Kind::Eof) {
            state_ = State::Eof;
            return ReadResult::eof();
        }

        if (o.kind == ScanOutcome::Kind::NeedRecover) {
            // Bytes were dropped, so a half-consumed deflate stream is useless.
            // The cipher register is left alone.
            inflater_.reset();
            last_recover_.code       = o.code;
            last_recover_.corrupt_at = o.corrupt_at;
            last_recover_.resumed_at = o.resumed_at;
            ++recover_count_;
            return ReadResult::need_recover(o.code);
        }

        std::vector<uint8_t>& payload = frame_.payload;
        if (crypto_) {
            crypto_->begin_frame();
            crypto_->decrypt(payload.data(), payload.size());
        }

        const size_t limit = std::min(capacity, kSingleLogMaxLength);
        inflater_.decompress(payload.data(), payload.size(), decoded_, limit);

        if (!decoded_.empty())
            std::memcpy(buf, decoded_.data(), decoded_.size());
        return ReadResult::success(decoded_.size());
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
}

ReadResult GlogReader::read(std::vector<uint8_t>& out) {
    out.resize(kSingleLogMaxLength);
    ReadResult r;
    try {
        r = read(out.data(), out.size());
    } catch (...) {
        out.clear();
        throw;
    }
    out.resize(r.length);
    return r;
}

// ── Opening ───────────────────────────────────────────────────────────────────

std::vector<uint8_t> private_key_from_string(const std::string& key) {
    std::vector<uint8_t> sk;
    if (is_hex_string(key, 2 * ecdh::kPrivateKeyLen))
        sk = hex_decode(key);
    else if (key.size() == ecdh::kPrivateKeyLen)
        sk.assign(key.begin(), key.end());
    else
        throw CryptoError(CryptoErrc::InvalidPrivateKey,
            "expected 64 hex characters or 32 raw bytes");

    ecdh::check_private_key(sk);
    return sk;
}

std::unique_ptr<GlogReader> open(const std::string& path, ReaderOptions options) {
    return std::make_unique<GlogReader>(std::make_unique<FileSource>(path),
                                        std::vector<uint8_t>(), options);
}

std::unique_ptr<GlogReader> open_with_key(const std::string& path,
                                          const std::string& private_key,
                                          ReaderOptions options)
{
    std::vector<uint8_t> sk = private_key_from_string(private_key);
    auto reader = std::make_unique<GlogReader>(std::make_unique<FileSource>(path), sk, options);
    OPENSSL_cleanse(sk.data(), sk.size());
    return reader;
}

} // namespace glog
