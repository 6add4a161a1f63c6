#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace glog {

// Readable byte stream positioned at offset 0 of a container.
// read() returns 0 only at end of stream; I/O failures throw std::runtime_error.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(uint8_t* dst, size_t n) = 0;
};

// Any std::istream, e.g. an entry streamed out of an archive. Not owned.
class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}
    size_t read(uint8_t* dst, size_t n) override;
private:
    std::istream& in_;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);
    size_t read(uint8_t* dst, size_t n) override;
    const std::string& path() const { return path_; }
private:
    std::string   path_;
    std::ifstream file_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
    size_t read(uint8_t* dst, size_t n) override;
private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace glog
