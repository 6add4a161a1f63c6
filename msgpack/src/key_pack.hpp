#pragma once
#include "server_key.hpp"
#include <vector>
#include <cstdint>
#include <string>

namespace key_mp {
    std::vector<uint8_t> pack(const glog::ServerKey& key);
    glog::ServerKey      unpack(const std::vector<uint8_t>& data);
    void                 pack_to_file(const glog::ServerKey& key, const std::string& path);
    glog::ServerKey      unpack_from_file(const std::string& path);
}
