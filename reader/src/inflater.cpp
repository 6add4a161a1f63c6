#include "inflater.hpp"
#include "glog_error.hpp"
#include <stdexcept>
#include <string>

namespace glog {

static constexpr size_t kInflateChunk = 16 * 1024;

Decompressor::Decompressor(bool enabled) : enabled_(enabled) {
    if (!enabled_) return;
    zs_.zalloc = Z_NULL;
    zs_.zfree  = Z_NULL;
    zs_.opaque = Z_NULL;
    if (inflateInit(&zs_) != Z_OK) {
        enabled_ = false;
        throw std::runtime_error("zlib: inflateInit failed");
    }
}

Decompressor::~Decompressor() {
    if (enabled_) inflateEnd(&zs_);
}

void Decompressor::reset() {
    if (enabled_) inflateReset(&zs_);
    needs_reset_ = false;
}

void Decompressor::decompress(const uint8_t* in, size_t n,
                              std::vector<uint8_t>& out, size_t max_out)
{
    if (!enabled_) {
        if (n > max_out)
            throw FormatError(FormatErrc::FrameTooLarge,
                "record of " + std::to_string(n) + " bytes exceeds " + std::to_string(max_out));
        out.assign(in, in + n);
        return;
    }

    out.clear();
    if (needs_reset_) reset();
    if (n == 0) return;

    zs_.next_in  = const_cast<Bytef*>(in);
    zs_.avail_in = static_cast<uInt>(n);

    uint8_t chunk[kInflateChunk];
    for (;;) {
        zs_.next_out  = chunk;
        zs_.avail_out = static_cast<uInt>(sizeof(chunk));

        int rc = inflate(&zs_, Z_SYNC_FLUSH);
        size_t produced = sizeof(chunk) - zs_.avail_out;

        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            std::string msg = zs_.msg ? zs_.msg : ("inflate returned " + std::to_string(rc));
            reset();
            throw DecompressError(msg);
        }

        if (out.size() + produced > max_out) {
            reset();
            throw FormatError(FormatErrc::FrameTooLarge,
                "inflated record exceeds " + std::to_string(max_out) + " bytes");
        }
        out.insert(out.end(), chunk, chunk + produced);

        if (rc == Z_STREAM_END) {
            if (zs_.avail_in != 0) {
                reset();
                throw DecompressError("trailing bytes after end of zlib stream");
            }
            needs_reset_ = true;
            return;
        }

        // Input used up and inflate had room to spare: the rest of the
        // stream arrives with the next frame.
        if (zs_.avail_in == 0 && zs_.avail_out != 0)
            return;

        if (rc == Z_BUF_ERROR && zs_.avail_out != 0) {
            reset();
            throw DecompressError("inflate made no progress");
        }
    }
}

} // namespace glog
