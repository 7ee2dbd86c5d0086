//
// Created by Giuseppe Francione on 03/02/26.
//

#include "../../include/jpeg_segments.hpp"
#include "../../include/errors.hpp"
#include <string>

namespace unmeta {

namespace {

    // markers that carry no length field
    bool is_standalone(const unsigned char marker) {
        return marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7);
    }

} // namespace

JpegLayout parse_jpeg_segments(const std::span<const unsigned char> bytes) {
    if (bytes.size() < 4 || bytes[0] != 0xFF || bytes[1] != 0xD8) {
        throw CleaningError("Missing JPEG SOI marker");
    }

    JpegLayout layout;
    size_t pos = 2;
    while (true) {
        if (pos >= bytes.size()) {
            throw CleaningError("JPEG stream ends before the first scan");
        }
        if (bytes[pos] != 0xFF) {
            throw CleaningError("Expected a JPEG marker at offset " + std::to_string(pos));
        }

        // any number of 0xFF fill bytes may precede a marker
        size_t marker_pos = pos;
        while (marker_pos + 1 < bytes.size() && bytes[marker_pos + 1] == 0xFF) {
            ++marker_pos;
        }
        if (marker_pos + 1 >= bytes.size()) {
            throw CleaningError("Truncated JPEG marker at offset " + std::to_string(pos));
        }
        const unsigned char marker = bytes[marker_pos + 1];

        if (marker == kJpegSos || marker == kJpegEoi) {
            layout.scan_offset = marker_pos;
            return layout;
        }
        if (is_standalone(marker)) {
            JpegSegment& segment = layout.segments.emplace_back();
            segment.marker = marker;
            segment.offset = marker_pos;
            segment.size = 2;
            pos = marker_pos + 2;
            continue;
        }

        if (marker_pos + 4 > bytes.size()) {
            throw CleaningError("Truncated JPEG segment at offset " + std::to_string(marker_pos));
        }
        const size_t length = (static_cast<size_t>(bytes[marker_pos + 2]) << 8) | bytes[marker_pos + 3];
        if (length < 2 || marker_pos + 2 + length > bytes.size()) {
            throw CleaningError("JPEG segment overruns the file at offset " + std::to_string(marker_pos));
        }

        JpegSegment& segment = layout.segments.emplace_back();
        segment.marker = marker;
        segment.offset = marker_pos;
        segment.size = 2 + length;
        segment.payload = bytes.subspan(marker_pos + 4, length - 2);
        pos = marker_pos + 2 + length;
    }
}

} // namespace unmeta
