#pragma once
#include "glog.hpp"
#include "stream_cursor.hpp"
#include <cstdint>

// Glog container prologue (lengths little-endian):
//
//  V3 (recovery)                        V4 (cipher)
//  ------------------------------       ------------------------------------
//  magic            4  1B AD C0 DE      magic            4
//  version          1  0x03             version          1  0x04
//  mode set         1                   proto_name_len   2
//  proto_name_len   2                   proto_name       N
//  proto_name       N                   sync marker      8
//  sync marker      8                   mode set         1
//                                       iv              16  (Encrypted only)
//                                       client pub key  33  (Encrypted only)
//
// Every frame that follows is: log_length(2) | log_data | sync marker(8).

namespace glog {

// Consume the prologue from `cur`, leaving it at the first frame.
// Throws FormatError (BadMagic, UnsupportedVersion, Truncated, BadSyncMarker).
ContainerHeader parse_header(StreamCursor& cur);

inline uint16_t read_u16le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

} // namespace glog
