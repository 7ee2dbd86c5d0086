//
// Created by Giuseppe Francione on 03/02/26.
//

/**
 * @file png_chunks.hpp
 * @brief Chunk-level access to PNG streams.
 */

#ifndef UNMETA_PNG_CHUNKS_HPP
#define UNMETA_PNG_CHUNKS_HPP

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace unmeta {

    inline constexpr std::array<unsigned char, 8> kPngSignature = {
        0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
    };

    /**
     * @brief One chunk of a PNG stream: its 4-letter type and its payload.
     */
    struct PngChunk {
        std::string type;
        std::vector<unsigned char> data;
    };

    [[nodiscard]] bool has_png_signature(std::span<const unsigned char> bytes) noexcept;

    /**
     * @brief Splits a PNG stream into chunks, up to and including IEND.
     *
     * Every CRC is verified. Bytes trailing IEND are ignored.
     * @throws CleaningError on a bad signature, truncation or CRC mismatch.
     */
    std::vector<PngChunk> parse_png_chunks(std::span<const unsigned char> bytes);

    /**
     * @brief Writes the signature followed by the given chunks, with fresh CRCs.
     */
    std::vector<unsigned char> serialize_png_chunks(const std::vector<PngChunk>& chunks);

    /**
     * @brief Inflates a zlib stream (as found in zTXt, iTXt and iCCP).
     * @param max_size Upper bound on the inflated size.
     * @throws CleaningError on corrupt data or when max_size is exceeded.
     */
    std::string inflate_zlib(std::span<const unsigned char> data, size_t max_size = 16u << 20);

} // namespace unmeta

#endif // UNMETA_PNG_CHUNKS_HPP
