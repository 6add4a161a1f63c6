#pragma once
#include "server_key.hpp"
#include <string>

namespace glog {

// Load a server key from a file path. The format is auto-detected:
//   64 hex characters       bare private scalar, default options
//   exactly 32 bytes        raw private scalar, default options
//   first byte '-' (0x2D)   YAML document
//   anything else           msgpack
// The stored pk and id must match the ones derived from sk.
// Throws std::runtime_error naming the file on failure.
ServerKey load_server_key(const std::string& path);

// Fill in pk/id from sk where absent and reject a key whose stored pk or id
// disagrees with its scalar. `origin` prefixes error messages.
void verify_server_key(ServerKey& key, const std::string& origin);

} // namespace glog
