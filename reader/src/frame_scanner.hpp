#pragma once
#include "glog.hpp"
#include "stream_cursor.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace glog {

// One length-delimited record, still compressed/encrypted as stored.
struct RawFrame {
    uint64_t             offset = 0;   // stream offset of the length prefix
    std::vector<uint8_t> payload;
};

struct ScanOutcome {
    enum class Kind { Frame, Eof, NeedRecover };

    Kind        kind       = Kind::Eof;
    RecoverCode code       = RecoverCode::TrailerMismatch;
    uint64_t    corrupt_at = 0;   // start of the rejected frame
    uint64_t    resumed_at = 0;   // where scanning continues
};

// Splits the post-header stream into frames terminated by the sync marker.
//
// A frame whose trailer does not match is first assumed to have a trailer
// damaged in place: if a well-formed frame starts right after it, scanning
// resumes there. Otherwise (and for a frame cut short by the end of the
// stream) the scanner moves forward one byte at a time from just after the
// bad frame's start and stops at the earliest position that is either
//   - an occurrence of the marker (resume right after it), or
//   - the start of a well-formed frame (resume there).
// A well-formed frame is one whose trailer is the first marker occurrence
// after its length prefix. If nothing is found before the stream ends, the
// outcome is Eof.
class FrameScanner {
public:
    FrameScanner(StreamCursor& cursor, const std::array<uint8_t, kSyncMarkerLen>& marker)
        : cursor_(cursor), marker_(marker) {}

    // Fills `out` only when the outcome is Frame.
    ScanOutcome next(RawFrame& out);

private:
    ScanOutcome resync(RecoverCode code, uint64_t frame_start);
    bool is_marker(const uint8_t* p) const;
    bool frame_at(size_t offset);

    StreamCursor& cursor_;
    std::array<uint8_t, kSyncMarkerLen> marker_;
};

} // namespace glog
