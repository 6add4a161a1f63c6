#include "stream_cursor.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace glog {

static constexpr size_t kReadChunk = 64 * 1024;

StreamCursor::StreamCursor(std::unique_ptr<ByteSource> source)
    : source_(std::move(source))
{
    if (!source_) throw std::invalid_argument("StreamCursor: null source");
}

size_t StreamCursor::ensure(size_t want) {
    while (buf_.size() - head_ < want && !eof_) {
        if (head_ > 0) {
            buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(head_));
            head_ = 0;
        }
        size_t old   = buf_.size();
        size_t chunk = std::max(want - old, kReadChunk);
        buf_.resize(old + chunk);
        size_t got = source_->read(buf_.data() + old, chunk);
        buf_.resize(old + got);
        if (got == 0) eof_ = true;
    }
    return std::min(want, buf_.size() - head_);
}

const uint8_t* StreamCursor::peek(size_t offset, size_t n) {
    if (ensure(offset + n) < offset + n) return nullptr;
    return buf_.data() + head_ + offset;
}

void StreamCursor::skip(size_t n) {
    if (n > buf_.size() - head_)
        throw std::logic_error("StreamCursor::skip past buffered data");
    head_     += n;
    position_ += n;
}

} // namespace glog
