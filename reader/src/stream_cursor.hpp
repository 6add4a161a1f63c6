#pragma once
#include "byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace glog {

// Forward-only buffered cursor over a ByteSource. Look-ahead is limited to
// what callers peek, so memory stays bounded by the largest peek window.
class StreamCursor {
public:
    explicit StreamCursor(std::unique_ptr<ByteSource> source);

    // Buffer up to `want` bytes past the cursor; returns how many are available
    // (less than `want` only when the source is exhausted).
    size_t ensure(size_t want);

    // Pointer to `n` bytes starting `offset` bytes past the cursor, or nullptr
    // if the stream ends first. Invalidated by the next ensure/peek/skip.
    // `n` must be non-zero.
    const uint8_t* peek(size_t offset, size_t n);

    // Advance past `n` bytes that are already available.
    void skip(size_t n);

    uint64_t position() const { return position_; }
    bool at_end() { return ensure(1) == 0; }

private:
    std::unique_ptr<ByteSource> source_;
    std::vector<uint8_t> buf_;
    size_t   head_     = 0;
    bool     eof_      = false;
    uint64_t position_ = 0;
};

} // namespace glog
