//
// Created by Giuseppe Francione on 04/02/26.
//

#ifndef UNMETA_EXIF_READER_HPP
#define UNMETA_EXIF_READER_HPP

#include "meta_value.hpp"
#include <span>

namespace unmeta::exif {

    /**
     * @brief Decodes a TIFF-structured EXIF block into a metadata map.
     *
     * IFD0 entries land at the top level; the Exif and GPS sub-IFDs become
     * nested maps under "Exif" and "GPS". Well-known tags are named, the
     * rest appear as "Tag 0xNNNN". Both byte orders are supported.
     *
     * @param tiff The block starting at the byte-order mark ("II" or "MM").
     *             For a JPEG APP1 segment, the "Exif\0\0" prefix must be
     *             stripped first.
     * A tag whose value, or a sub-IFD whose entries, lie outside the block
     * is reported as "invalid" and the rest of the block is still read.
     *
     * @throws CleaningError if the header is invalid, IFD0 lies outside the
     *         block or the IFD chain loops.
     */
    [[nodiscard]] MetaMap read_tiff(std::span<const unsigned char> tiff);

    /// @return true if payload starts with the "Exif\0\0" APP1 identifier.
    [[nodiscard]] bool has_exif_prefix(std::span<const unsigned char> payload) noexcept;

} // namespace unmeta::exif

#endif // UNMETA_EXIF_READER_HPP
