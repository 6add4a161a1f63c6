#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace glog {

// ── Container constants ───────────────────────────────────────────────────────

static constexpr std::array<uint8_t, 4> kMagic      = {0x1B, 0xAD, 0xC0, 0xDE};
static constexpr std::array<uint8_t, 8> kSyncMarker = {0xB7, 0xDB, 0xE7, 0xDB,
                                                      0x80, 0xAD, 0xD9, 0x57};

static constexpr size_t kMagicLen        = 4;
static constexpr size_t kSyncMarkerLen   = 8;
static constexpr size_t kLengthFieldLen  = 2;
static constexpr size_t kIvLen           = 16;
static constexpr size_t kClientPubKeyLen = 33;   // compressed SEC1 point
static constexpr size_t kSessionKeyLen   = 16;   // AES-128
static constexpr size_t kMaxRawFrameLen  = 0xFFFF;

// Upper bound on one decoded log record.
static constexpr size_t kSingleLogMaxLength = 16 * 1024;

enum class FormatVersion : uint8_t {
    V3 = 0x03,   // recovery: sync marker after every record
    V4 = 0x04    // cipher: adds IV and client public key
};

// Mode byte: compression in the high nibble, encryption in the low nibble.
// Bits other than the version's two flags are reserved and kept verbatim.
struct ModeSet {
    uint8_t raw = 0;

    static constexpr uint8_t compressed_bit(FormatVersion v) {
        return v == FormatVersion::V3 ? 0x10 : 0x20;
    }
    static constexpr uint8_t encrypted_bit(FormatVersion v) {
        return v == FormatVersion::V3 ? 0x01 : 0x02;
    }

    bool compressed(FormatVersion v) const { return (raw & compressed_bit(v)) != 0; }
    bool encrypted(FormatVersion v)  const { return (raw & encrypted_bit(v))  != 0; }
    uint8_t reserved(FormatVersion v) const {
        return static_cast<uint8_t>(raw & ~(compressed_bit(v) | encrypted_bit(v)));
    }
};

struct ContainerHeader {
    FormatVersion version = FormatVersion::V3;
    ModeSet       mode;
    std::string   proto_name;
    std::array<uint8_t, kSyncMarkerLen>   sync_marker{};
    std::array<uint8_t, kIvLen>           iv{};               // V4 + Encrypted only
    std::array<uint8_t, kClientPubKeyLen> client_public_key{}; // V4 + Encrypted only
    size_t        header_len = 0;   // bytes consumed from offset 0

    bool compressed() const { return mode.compressed(version); }
    // V3 carries no key material, so its encryption flag is never honoured.
    bool encrypted() const {
        return version == FormatVersion::V4 && mode.encrypted(version);
    }
};

// Why a frame was skipped.
enum class RecoverCode : int32_t {
    TruncatedFrame  = -2,
    TrailerMismatch = -3
};

struct ReadResult {
    enum class Kind { Success, Eof, NeedRecover };

    Kind        kind   = Kind::Eof;
    size_t      length = 0;
    RecoverCode code   = RecoverCode::TrailerMismatch;

    static ReadResult success(size_t n) { return {Kind::Success, n, RecoverCode::TrailerMismatch}; }
    static ReadResult eof()             { return {Kind::Eof, 0, RecoverCode::TrailerMismatch}; }
    static ReadResult need_recover(RecoverCode c) { return {Kind::NeedRecover, 0, c}; }

    bool is_success() const      { return kind == Kind::Success; }
    bool is_eof() const          { return kind == Kind::Eof; }
    bool is_need_recover() const { return kind == Kind::NeedRecover; }
};

const char* version_name(FormatVersion v);
const char* recover_code_name(RecoverCode c);

} // namespace glog
