//
// Created by Giuseppe Francione on 05/02/26.
//

/**
 * @file png_parser.hpp
 * @brief Defines the Parser implementation for PNG files using libpng.
 */

#ifndef UNMETA_PNG_PARSER_HPP
#define UNMETA_PNG_PARSER_HPP

#include "parser.hpp"
#include <array>
#include <span>
#include <string_view>

namespace unmeta {

    /**
     * @brief Implements Parser for PNG files.
     *
     * @details Metadata is read straight from the chunk stream. Lightweight
     * cleaning drops the text, time and EXIF chunks and copies every other
     * chunk as is. Thorough cleaning decodes the image with libpng and
     * re-encodes it with critical chunks only, which also gets rid of
     * private and unknown ancillary chunks.
     */
    class PngParser final : public Parser {
    public:
        static constexpr std::string_view kName = "PngParser";
        static constexpr std::array<std::string_view, 1> kMimeTypes = { "image/png" };
        static constexpr std::array<std::string_view, 1> kExtensions = { ".png" };
        static constexpr std::array<std::string_view, 5> kMetaList = {
            "tEXt", "zTXt", "iTXt", "tIME", "eXIf"
        };

        /**
         * @throws InvalidInputError if the file cannot be opened or is not a PNG.
         */
        explicit PngParser(const std::filesystem::path& filename);
        ~PngParser() override;

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
         * @brief Reads text chunks, tIME and eXIf.
         *
         * Text chunks map keyword to text. An iTXt chunk with a language tag
         * or a translated keyword becomes a nested map. tIME is reported as
         * "Time" and eXIf as a nested "Exif" map.
         */
        [[nodiscard]] MetaMap get_meta() const override;

    protected:
        bool remove_all_lightweight() override;

        /**
         * @brief Decodes to 8-bit RGBA and re-encodes at compression level 9.
         *
         * The output color type is the smallest of gray, gray+alpha, RGB and
         * RGBA that holds the pixels. 16-bit samples are reduced to 8 bits.
         * @throws CleaningError if libpng rejects the input or the output cannot be written.
         */
        bool remove_all_thorough() override;
    };

} // namespace unmeta

#endif // UNMETA_PNG_PARSER_HPP
