#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <zlib.h>

namespace glog {

// zlib inflation applied per frame, or the identity when disabled.
//
// The inflate stream persists across frames, so a producer that deflates the
// whole log as one stream (sync-flushed at every record) decodes correctly.
// A frame that completes a zlib stream rearms the inflater for the next one,
// which also covers producers that compress each record on its own.
class Decompressor {
public:
    explicit Decompressor(bool enabled);
    ~Decompressor();

    Decompressor(const Decompressor&) = delete;
    Decompressor& operator=(const Decompressor&) = delete;

    bool enabled() const { return enabled_; }

    // Replace `out` with the decoded form of `in`. Output larger than
    // `max_out` throws FormatError(FrameTooLarge); malformed input throws
    // DecompressError and rearms the stream.
    void decompress(const uint8_t* in, size_t n, std::vector<uint8_t>& out, size_t max_out);

    // Drop any partially consumed stream (e.g. after bytes were skipped).
    void reset();

private:
    bool      enabled_;
    z_stream  zs_{};
    bool      needs_reset_ = false;
};

} // namespace glog
