#pragma once
#include "glog.hpp"
#include "byte_source.hpp"
#include "stream_cursor.hpp"
#include "frame_scanner.hpp"
#include "inflater.hpp"
#include "crypto_session.hpp"
#include "kdf.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace glog {

struct ReaderOptions {
    KdfAlg           kdf        = KdfAlg::Truncate;
    CipherContinuity continuity = CipherContinuity::PerSession;
};

// Where the last skipped region began and where reading picked up again.
struct RecoverEvent {
    RecoverCode code       = RecoverCode::TrailerMismatch;
    uint64_t    corrupt_at = 0;
    uint64_t    resumed_at = 0;
};

// Pull reader over one Glog container.
//
// Construction parses the header and, for an encrypted V4 stream, runs the
// key agreement. Each read() then yields one decoded record, a NeedRecover
// notice for a skipped corrupt region, or Eof. Records are decrypted first
// and inflated second.
//
// Any exception thrown by read() leaves the reader Failed; reading again
// throws std::logic_error. Not thread-safe.
class GlogReader {
public:
    enum class State { HeaderParsed, Streaming, Eof, Failed };

    // `private_key` is a 32-byte secp256k1 scalar, or empty when none is held.
    // Throws FormatError for a bad header; CryptoError(MissingKey) when the
    // stream is encrypted and no key is given; CryptoError for a bad key pair.
    explicit GlogReader(std::unique_ptr<ByteSource> source,
                        const std::vector<uint8_t>& private_key = {},
                        ReaderOptions options = {});

    GlogReader(const GlogReader&) = delete;
    GlogReader& operator=(const GlogReader&) = delete;

    // Decode the next record into `buf`. A record that does not fit in
    // min(capacity, single_log_max_length()) throws FormatError(FrameTooLarge).
    ReadResult read(uint8_t* buf, size_t capacity);

    // Same, with `out` resized to the decoded length (empty unless Success).
    ReadResult read(std::vector<uint8_t>& out);

    static size_t single_log_max_length() { return kSingleLogMaxLength; }

    const ContainerHeader& header() const { return header_; }
    const ReaderOptions&   options() const { return options_; }
    State                  state() const { return state_; }
    uint64_t               position() const { return cursor_.position(); }

    const RecoverEvent& last_recover() const { return last_recover_; }
    uint64_t            recover_count() const { return recover_count_; }

private:
    StreamCursor                   cursor_;
    ContainerHeader                header_;
    FrameScanner                   scanner_;
    Decompressor                   inflater_;
    ReaderOptions                  options_;
    std::unique_ptr<CryptoSession> crypto_;
    State                          state_ = State::HeaderParsed;

    RawFrame             frame_;
    std::vector<uint8_t> decoded_;
    RecoverEvent         last_recover_;
    uint64_t             recover_count_ = 0;
};

// Interpret a caller-supplied private key: 64 hex characters, or the 32 raw
// bytes themselves. Throws CryptoError(InvalidPrivateKey).
std::vector<uint8_t> private_key_from_string(const std::string& key);

std::unique_ptr<GlogReader> open(const std::string& path, ReaderOptions options = {});
std::unique_ptr<GlogReader> open_with_key(const std::string& path,
                                          const std::string& private_key,
                                          ReaderOptions options = {});

} // namespace glog
