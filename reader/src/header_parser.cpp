#include "header_parser.hpp"
#include "glog_error.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace glog {

// Bytes for `field`, or Truncated. The pointer is valid until the next peek.
static const uint8_t* need(StreamCursor& cur, size_t n, const char* field) {
    const uint8_t* p = cur.peek(0, n);
    if (!p) {
        throw FormatError(FormatErrc::Truncated,
            std::string("header ends inside ") + field + " at offset " +
            std::to_string(cur.position()));
    }
    return p;
}

static uint8_t take_u8(StreamCursor& cur, const char* field) {
    uint8_t v = *need(cur, 1, field);
    cur.skip(1);
    return v;
}

static std::string take_proto_name(StreamCursor& cur) {
    uint16_t len = read_u16le(need(cur, kLengthFieldLen, "proto name length"));
    cur.skip(kLengthFieldLen);
    if (len == 0) return std::string();
    const uint8_t* p = need(cur, len, "proto name");
    std::string name(reinterpret_cast<const char*>(p), len);
    cur.skip(len);
    return name;
}

static void take_sync_marker(StreamCursor& cur, ContainerHeader& hdr) {
    const uint8_t* p = need(cur, kSyncMarkerLen, "sync marker");
    std::copy(p, p + kSyncMarkerLen, hdr.sync_marker.begin());
    cur.skip(kSyncMarkerLen);
    if (hdr.sync_marker != kSyncMarker)
        throw FormatError(FormatErrc::BadSyncMarker, "header sync marker does not match");
}

ContainerHeader parse_header(StreamCursor& cur) {
    const uint64_t start = cur.position();

    const uint8_t* m = need(cur, kMagicLen, "magic");
    if (std::memcmp(m, kMagic.data(), kMagicLen) != 0)
        throw FormatError(FormatErrc::BadMagic, "not a glog container");
    cur.skip(kMagicLen);

    ContainerHeader hdr;
    uint8_t version = take_u8(cur, "version");
    switch (version) {
        case 0x03: hdr.version = FormatVersion::V3; break;
        case 0x04: hdr.version = FormatVersion::V4; break;
        default:
            throw FormatError(FormatErrc::UnsupportedVersion,
                              "version " + std::to_string((int)version));
    }

    if (hdr.version == FormatVersion::V3) {
        hdr.mode.raw   = take_u8(cur, "mode set");
        hdr.proto_name = take_proto_name(cur);
        take_sync_marker(cur, hdr);
    } else {
        hdr.proto_name = take_proto_name(cur);
        take_sync_marker(cur, hdr);
        hdr.mode.raw   = take_u8(cur, "mode set");

        if (hdr.encrypted()) {
            const uint8_t* iv = need(cur, kIvLen, "iv");
            std::copy(iv, iv + kIvLen, hdr.iv.begin());
            cur.skip(kIvLen);

            const uint8_t* pk = need(cur, kClientPubKeyLen, "client public key");
            std::copy(pk, pk + kClientPubKeyLen, hdr.client_public_key.begin());
            cur.skip(kClientPubKeyLen);
        }
    }

    hdr.header_len = static_cast<size_t>(cur.position() - start);
    return hdr;
}

} // namespace glog
