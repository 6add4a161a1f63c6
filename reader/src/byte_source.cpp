#include "byte_source.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace glog {

static size_t read_istream(std::istream& in, uint8_t* dst, size_t n, const char* what) {
    if (n == 0) return 0;
    in.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(n));
    size_t got = static_cast<size_t>(in.gcount());
    if (in.bad())
        throw std::runtime_error(std::string(what) + ": read error");
    // Short read with eofbit is the end of the stream, not an error.
    if (got < n && in.eof())
        in.clear(std::ios::eofbit);
    return got;
}

size_t IstreamSource::read(uint8_t* dst, size_t n) {
    return read_istream(in_, dst, n, "istream");
}

FileSource::FileSource(const std::string& path)
    : path_(path), file_(path, std::ios::binary)
{
    if (!file_)
        throw std::runtime_error("Cannot open file: " + path);
}

size_t FileSource::read(uint8_t* dst, size_t n) {
    return read_istream(file_, dst, n, path_.c_str());
}

size_t MemorySource::read(uint8_t* dst, size_t n) {
    size_t take = std::min(n, data_.size() - pos_);
    if (take > 0) {
        std::memcpy(dst, data_.data() + pos_, take);
        pos_ += take;
    }
    return take;
}

} // namespace glog
