//
// Created by Giuseppe Francione on 06/02/26.
//

/**
 * @file jpeg_parser.hpp
 * @brief Defines the Parser implementation for JPEG files.
 */

#ifndef UNMETA_JPEG_PARSER_HPP
#define UNMETA_JPEG_PARSER_HPP

#include "parser.hpp"
#include <array>
#include <span>
#include <string_view>

namespace unmeta {

    /**
     * @brief Implements Parser for JPEG files using libjpeg.
     *
     * @details Lightweight cleaning removes the COM, EXIF, XMP, Photoshop,
     * Ducky/PictureInfo and FlashPix segments and copies everything else,
     * scan data included, byte for byte. Thorough cleaning performs a
     * lossless coefficient transcode, similar to `jpegtran -copy none`,
     * which keeps no application segment at all.
     */
    class JpegParser final : public Parser {
    public:
        static constexpr std::string_view kName = "JpegParser";
        static constexpr std::array<std::string_view, 1> kMimeTypes = { "image/jpeg" };
        static constexpr std::array<std::string_view, 3> kExtensions = { ".jpg", ".jpeg", ".jpe" };
        static constexpr std::array<std::string_view, 7> kMetaList = {
            "Comment", "Exif", "XMP", "Photoshop", "Ducky", "PictureInfo", "FlashPix"
        };

        /**
         * @throws InvalidInputError if the file cannot be opened or does not start with SOI.
         */
        explicit JpegParser(const std::filesystem::path& filename);
        ~JpegParser() override;

        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override { return kName; }

        [[nodiscard]] std::span<const std::string_view> get_meta_list() const noexcept override {
            return {kMetaList.data(), kMetaList.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            return {kMimeTypes.data(), kMimeTypes.size()};
        }

        // --- operations ---

        /**
         * @brief Reads the header segments.
         *
         * Segments named in kMetaList are reported under those names (EXIF
         * as a nested map). Other application segments, except the JFIF,
         * ICC profile and Adobe ones needed to decode the image, are
         * reported as "APPn" with their size.
         */
        [[nodiscard]] MetaMap get_meta() const override;

    protected:
        bool remove_all_lightweight() override;

        /**
         * @brief Losslessly transcodes the DCT coefficients into a new file.
         * @throws CleaningError if libjpeg rejects the input or the output cannot be written.
         */
        bool remove_all_thorough() override;
    };

} // namespace unmeta

#endif // UNMETA_JPEG_PARSER_HPP
