#include "frame_scanner.hpp"
#include "header_parser.hpp"
#include <cstring>

namespace glog {

bool FrameScanner::is_marker(const uint8_t* p) const {
    return std::memcmp(p, marker_.data(), kSyncMarkerLen) == 0;
}

bool FrameScanner::frame_at(size_t offset) {
    const uint8_t* lp = cursor_.peek(offset, kLengthFieldLen);
    if (!lp) return false;
    const size_t len = read_u16le(lp);

    const uint8_t* body = cursor_.peek(offset + kLengthFieldLen, len + kSyncMarkerLen);
    if (!body || !is_marker(body + len)) return false;

    // Any earlier marker means the length only lines up by chance.
    for (size_t i = 0; i < len; ++i)
        if (is_marker(body + i)) return false;
    return true;
}

ScanOutcome FrameScanner::next(RawFrame& out) {
    ScanOutcome res;
    const uint64_t start = cursor_.position();

    // A missing or half-written length prefix is where a writer stopped.
    const uint8_t* lp = cursor_.peek(0, kLengthFieldLen);
    if (!lp) {
        cursor_.skip(cursor_.ensure(kLengthFieldLen));
        res.kind       = ScanOutcome::Kind::Eof;
        res.resumed_at = cursor_.position();
        return res;
    }

    const size_t len   = read_u16le(lp);
    const size_t total = kLengthFieldLen + len + kSyncMarkerLen;

    const uint8_t* p = cursor_.peek(0, total);
    if (!p)
        return resync(RecoverCode::TruncatedFrame, start);
    if (!is_marker(p + kLengthFieldLen + len)) {
        if (frame_at(total)) {
            cursor_.skip(total);
            res.kind       = ScanOutcome::Kind::NeedRecover;
            res.code       = RecoverCode::TrailerMismatch;
            res.corrupt_at = start;
            res.resumed_at = cursor_.position();
            return res;
        }
        return resync(RecoverCode::TrailerMismatch, start);
    }

    out.offset = start;
    out.payload.assign(p + kLengthFieldLen, p + kLengthFieldLen + len);
    cursor_.skip(total);

    res.kind       = ScanOutcome::Kind::Frame;
    res.resumed_at = cursor_.position();
    return res;
}

ScanOutcome FrameScanner::resync(RecoverCode code, uint64_t frame_start) {
    ScanOutcome res;
    res.code       = code;
    res.corrupt_at = frame_start;

    // The claimed frame start is known bad; begin one byte later.
    cursor_.skip(1);

    for (;;) {
        const uint8_t* w = cursor_.peek(0, kSyncMarkerLen);
        if (!w) break;

        if (is_marker(w)) {
            cursor_.skip(kSyncMarkerLen);
            res.kind       = ScanOutcome::Kind::NeedRecover;
            res.resumed_at = cursor_.position();
            return res;
        }

        if (frame_at(0)) {
            res.kind       = ScanOutcome::Kind::NeedRecover;
            res.resumed_at = cursor_.position();
            return res;
        }

        cursor_.skip(1);
    }

    // Fewer than a marker's worth of bytes left: nothing more to recover.
    cursor_.skip(cursor_.ensure(kSyncMarkerLen));
    res.kind       = ScanOutcome::Kind::Eof;
    res.resumed_at = cursor_.position();
    return res;
}

} // namespace glog
