#include "glog_error.hpp"
#include "glog.hpp"

namespace glog {

const char* errc_name(FormatErrc c) {
    switch (c) {
        case FormatErrc::BadMagic:           return "BadMagic";
        case FormatErrc::UnsupportedVersion: return "UnsupportedVersion";
        case FormatErrc::Truncated:          return "Truncated";
        case FormatErrc::BadSyncMarker:      return "BadSyncMarker";
        case FormatErrc::FrameTooLarge:      return "FrameTooLarge";
    }
    return "FormatError";
}

const char* errc_name(CryptoErrc c) {
    switch (c) {
        case CryptoErrc::MissingKey:        return "MissingKey";
        case CryptoErrc::InvalidPrivateKey: return "InvalidPrivateKey";
        case CryptoErrc::InvalidPublicKey:  return "InvalidPublicKey";
        case CryptoErrc::DecryptFailed:     return "DecryptFailed";
    }
    return "CryptoError";
}

const char* version_name(FormatVersion v) {
    switch (v) {
        case FormatVersion::V3: return "V3";
        case FormatVersion::V4: return "V4";
    }
    return "unknown";
}

const char* recover_code_name(RecoverCode c) {
    switch (c) {
        case RecoverCode::TruncatedFrame:  return "TruncatedFrame";
        case RecoverCode::TrailerMismatch: return "TrailerMismatch";
    }
    return "unknown";
}

} // namespace glog
