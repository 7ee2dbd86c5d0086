//
// Created by Giuseppe Francione on 03/02/26.
//

/**
 * @file jpeg_segments.hpp
 * @brief Marker-segment level access to JPEG streams.
 */

#ifndef UNMETA_JPEG_SEGMENTS_HPP
#define UNMETA_JPEG_SEGMENTS_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace unmeta {

    inline constexpr unsigned char kJpegApp0 = 0xE0;
    inline constexpr unsigned char kJpegCom  = 0xFE;
    inline constexpr unsigned char kJpegSos  = 0xDA;
    inline constexpr unsigned char kJpegEoi  = 0xD9;

    /**
     * @brief A marker segment found before the first scan.
     *
     * Standalone markers (TEM, RSTn) have no length field and an empty payload.
     */
    struct JpegSegment {
        unsigned char marker = 0;                 ///< Second byte of the marker (e.g. 0xE1 for APP1)
        size_t offset = 0;                        ///< Offset of the 0xFF byte in the stream
        size_t size = 0;                          ///< Marker + length field + payload, in bytes
        std::span<const unsigned char> payload;   ///< Payload without the length field
    };

    /**
     * @brief Header segments of a JPEG stream and where the scan data begins.
     *
     * Everything from scan_offset to the end (SOS, entropy-coded data,
     * following scans, EOI and any trailer) is opaque to metadata cleaning
     * and is copied verbatim.
     */
    struct JpegLayout {
        std::vector<JpegSegment> segments;
        size_t scan_offset = 0;
    };

    /**
     * @brief Walks the marker segments of a JPEG stream up to the first SOS.
     * @throws CleaningError if the stream does not start with SOI or a segment overruns the data.
     */
    JpegLayout parse_jpeg_segments(std::span<const unsigned char> bytes);

} // namespace unmeta

#endif // UNMETA_JPEG_SEGMENTS_HPP
