#pragma once
#include <stdexcept>
#include <string>

namespace glog {

enum class FormatErrc {
    BadMagic,
    UnsupportedVersion,
    Truncated,
    BadSyncMarker,
    FrameTooLarge
};

enum class CryptoErrc {
    MissingKey,
    InvalidPrivateKey,
    InvalidPublicKey,
    DecryptFailed
};

const char* errc_name(FormatErrc c);
const char* errc_name(CryptoErrc c);

// Malformed container structure. Always fatal for the session.
class FormatError : public std::runtime_error {
public:
    FormatError(FormatErrc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what), code_(code) {}
    FormatErrc code() const { return code_; }
private:
    FormatErrc code_;
};

// Key setup or cipher failure.
class CryptoError : public std::runtime_error {
public:
    CryptoError(CryptoErrc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what), code_(code) {}
    CryptoErrc code() const { return code_; }
private:
    CryptoErrc code_;
};

// A well-framed payload that zlib refuses.
class DecompressError : public std::runtime_error {
public:
    explicit DecompressError(const std::string& what)
        : std::runtime_error("DecompressError: " + what) {}
};

} // namespace glog
