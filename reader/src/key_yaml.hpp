#pragma once
#include "server_key.hpp"
#include <string>

namespace glog {

// Serialize a server key as a YAML document ("---" first, so the loader's
// first-byte sniff recognises it). Keys are hex.
std::string emit_key_yaml(const ServerKey& key);

} // namespace glog
