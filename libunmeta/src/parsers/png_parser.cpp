//
// Created by Giuseppe Francione on 05/02/26.
//

#include "../../include/png_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_reader.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/png_chunks.hpp"
#include <png.h>
#include <zlib.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace unmeta {

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    std::string latin1_field(const std::vector<unsigned char>& data, size_t begin, const size_t end) {
        begin = std::min(begin, end);
        return {reinterpret_cast<const char*>(data.data()) + begin, end - begin};
    }

    size_t find_nul(const std::vector<unsigned char>& data, const size_t from) {
        const auto it = std::find(data.begin() + static_cast<std::ptrdiff_t>(std::min(from, data.size())),
                                  data.end(), 0);
        return static_cast<size_t>(it - data.begin());
    }

    void read_text_chunk(const PngChunk& chunk, MetaMap& meta) {
        const auto& d = chunk.data;
        const size_t key_end = find_nul(d, 0);
        if (key_end == 0 || key_end >= d.size()) {
            Logger::log(LogLevel::Warning, "Malformed " + chunk.type + " chunk skipped", "png_parser");
            return;
        }
        const std::string keyword = latin1_field(d, 0, key_end);

        if (chunk.type == "tEXt") {
            add_meta(meta, keyword, latin1_field(d, key_end + 1, d.size()));
            return;
        }

        if (chunk.type == "zTXt") {
            // keyword \0 method compressed-text
            if (key_end + 2 > d.size()) {
                throw CleaningError("Truncated zTXt chunk");
            }
            add_meta(meta, keyword, inflate_zlib(std::span(d).subspan(key_end + 2)));
            return;
        }

        // iTXt: keyword \0 flag method language \0 translated \0 text
        if (key_end + 3 > d.size()) {
            throw CleaningError("Truncated iTXt chunk");
        }
        const bool compressed = d[key_end + 1] != 0;
        const size_t lang_begin = key_end + 3;
        const size_t lang_end = find_nul(d, lang_begin);
        const size_t trans_end = find_nul(d, lang_end + 1);
        if (lang_end >= d.size() || trans_end >= d.size()) {
            throw CleaningError("Truncated iTXt chunk");
        }
        const auto text_bytes = std::span(d).subspan(trans_end + 1);
        std::string text = compressed ? inflate_zlib(text_bytes)
                                      : std::string(text_bytes.begin(), text_bytes.end());
        std::string language = latin1_field(d, lang_begin, lang_end);
        std::string translated = latin1_field(d, lang_end + 1, trans_end);

        if (language.empty() && translated.empty()) {
            add_meta(meta, keyword, std::move(text));
            return;
        }
        MetaMap nested;
        nested.emplace("text", std::move(text));
        if (!language.empty()) nested.emplace("language", std::move(language));
        if (!translated.empty()) nested.emplace("translated_keyword", std::move(translated));
        add_meta(meta, keyword, std::move(nested));
    }

    std::string format_time_chunk(const std::vector<unsigned char>& d) {
        if (d.size() != 7) {
            throw CleaningError("Invalid tIME chunk length: " + std::to_string(d.size()));
        }
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u %02u:%02u:%02u",
                      static_cast<unsigned>((d[0] << 8) | d[1]),
                      d[2], d[3], d[4], d[5], d[6]);
        return buf;
    }

    bool is_listed(const std::string& type) {
        return std::ranges::find(PngParser::kMetaList, std::string_view(type)) != PngParser::kMetaList.end();
    }

    /**
     * @brief Reads and decodes a PNG into a standard 8-bit RGBA buffer.
     */
    std::vector<unsigned char> read_to_rgba8(png_structp png, png_infop info,
                                             png_uint_32& width, png_uint_32& height) {
        int bit_depth, color_type;
        png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

        if (bit_depth == 16) png_set_strip_16(png);
        if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
        if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
        if (!(color_type & PNG_COLOR_MASK_ALPHA)) png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
        if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
        png_set_interlace_handling(png);

        png_read_update_info(png, info);

        const size_t rowbytes = png_get_rowbytes(png, info);
        if (rowbytes != static_cast<size_t>(width) * 4) {
            throw std::runtime_error("Rowbytes mismatch, expected RGBA8");
        }

        std::vector<unsigned char> image(rowbytes * height);
        std::vector<png_bytep> row_pointers(height);
        for (png_uint_32 y = 0; y < height; ++y) {
            row_pointers[y] = image.data() + y * rowbytes;
        }

        png_read_image(png, row_pointers.data());
        png_read_end(png, nullptr);

        return image;
    }

} // namespace

PngParser::PngParser(const std::filesystem::path& filename) : Parser(filename) {
    unique_FILE in(open_file(this->filename(), "rb"));
    if (!in) {
        throw InvalidInputError("Cannot open PNG input: " + this->filename().string());
    }
    unsigned char header[8] = {};
    const size_t n = std::fread(header, 1, sizeof(header), in.get());
    if (!has_png_signature(std::span<const unsigned char>(header, n))) {
        throw InvalidInputError("Not a PNG file: " + this->filename().string());
    }
}

PngParser::~PngParser() {
    finalize();
}

MetaMap PngParser::get_meta() const {
    std::vector<unsigned char> bytes;
    try {
        bytes = read_file_bytes(filename());
    } catch (const std::runtime_error& e) {
        throw CleaningError(e.what());
    }

    MetaMap meta;
    for (const auto& chunk : parse_png_chunks(bytes)) {
        if (chunk.type == "tEXt" || chunk.type == "zTXt" || chunk.type == "iTXt") {
            read_text_chunk(chunk, meta);
        } else if (chunk.type == "tIME") {
            add_meta(meta, "Time", format_time_chunk(chunk.data));
        } else if (chunk.type == "eXIf") {
            try {
                add_meta(meta, "Exif", exif::read_tiff(chunk.data));
            } catch (const CleaningError& e) {
                Logger::log(LogLevel::Warning, "Unreadable eXIf in " + filename().string() + ": " + e.what(),
                            "png_parser");
                add_meta(meta, "Exif", "invalid");
            }
        }
    }
    Logger::log(LogLevel::Debug, "Read " + std::to_string(meta.size()) + " metadata fields from " +
                filename().string(), "png_parser");
    return meta;
}

bool PngParser::remove_all_lightweight() {
    std::vector<unsigned char> bytes;
    try {
        bytes = read_file_bytes(filename());
    } catch (const std::runtime_error& e) {
        throw CleaningError(e.what());
    }

    auto chunks = parse_png_chunks(bytes);
    const auto before = chunks.size();
    std::erase_if(chunks, [](const PngChunk& c) { return is_listed(c.type); });
    Logger::log(LogLevel::Debug, "Dropped " + std::to_string(before - chunks.size()) + " chunks from " +
                filename().string(), "png_parser");

    try {
        write_file_bytes(output_filename(), serialize_png_chunks(chunks));
    } catch (const std::runtime_error& e) {
        throw CleaningError(e.what());
    }
    return true;
}

bool PngParser::remove_all_thorough() {
    const auto& input = filename();
    const auto& output = output_filename();

    try {
        unique_FILE fp_in(open_file(input, "rb"));
        if (!fp_in) {
            throw std::runtime_error("Cannot open PNG input: " + input.string());
        }

        PngRead rd;
        rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
        png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

        rd.info = png_create_info_struct(rd.png);
        if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
        if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng read error");

        png_init_io(rd.png, fp_in.get());
        png_read_info(rd.png, rd.info);

        png_uint_32 width, height;
        const std::vector<unsigned char> rgba = read_to_rgba8(rd.png, rd.info, width, height);

        bool all_gray = true;
        bool all_opaque = true;
        for (size_t i = 0; i < rgba.size(); i += 4) {
            if (rgba[i] != rgba[i + 1] || rgba[i + 1] != rgba[i + 2]) all_gray = false;
            if (rgba[i + 3] != 0xFF) all_opaque = false;
        }

        unique_FILE fp_out(open_file(output, "wb"));
        if (!fp_out) {
            throw std::runtime_error("Cannot open PNG output: " + output.string());
        }

        PngWrite wr;
        wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
        if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
        png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
        wr.info = png_create_info_struct(wr.png);
        if (!wr.info) throw std::runtime_error("png_create_info_struct failed (writer)");
        if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

        png_init_io(wr.png, fp_out.get());
        png_set_compression_level(wr.png, 9);
        png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

        int out_color_type;
        if (all_gray && all_opaque) {
            out_color_type = PNG_COLOR_TYPE_GRAY;
        } else if (all_gray) {
            out_color_type = PNG_COLOR_TYPE_GA;
        } else if (all_opaque) {
            out_color_type = PNG_COLOR_TYPE_RGB;
        } else {
            out_color_type = PNG_COLOR_TYPE_RGBA;
        }

        png_set_IHDR(wr.png, wr.info, width, height, 8, out_color_type,
                     PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
        // no ancillary chunk is set on wr.info, so none is written
        png_write_info(wr.png, wr.info);

        const png_size_t out_channels = png_get_channels(wr.png, wr.info);
        std::vector<unsigned char> out_rowbuf(static_cast<size_t>(width) * out_channels);
        png_bytep out_row = out_rowbuf.data();

        const unsigned char* p = rgba.data();
        for (png_uint_32 y = 0; y < height; ++y) {
            const unsigned char* src = p;
            unsigned char* dst = out_row;

            if (out_color_type == PNG_COLOR_TYPE_GRAY) {
                for (png_uint_32 x = 0; x < width; ++x, src += 4, dst += 1) {
                    dst[0] = src[0];
                }
            } else if (out_color_type == PNG_COLOR_TYPE_GA) {
                for (png_uint_32 x = 0; x < width; ++x, src += 4, dst += 2) {
                    dst[0] = src[0];
                    dst[1] = src[3];
                }
            } else if (out_color_type == PNG_COLOR_TYPE_RGB) {
                for (png_uint_32 x = 0; x < width; ++x, src += 4, dst += 3) {
                    dst[0] = src[0];
                    dst[1] = src[1];
                    dst[2] = src[2];
                }
            } else {
                std::memcpy(dst, src, static_cast<size_t>(width) * 4);
            }

            png_write_rows(wr.png, &out_row, 1);
            p += static_cast<size_t>(width) * 4;
        }

        png_write_end(wr.png, nullptr);

        if (std::fclose(fp_out.release()) != 0) {
            throw std::runtime_error("Cannot flush PNG output: " + output.string());
        }
    } catch (const CleaningError&) {
        throw;
    } catch (const std::exception& e) {
        throw CleaningError("PNG re-encoding of " + input.string() + " failed: " + e.what());
    }

    Logger::log(LogLevel::Info, "PNG re-encoding completed: " + output.string(), "png_parser");
    return true;
}

} // namespace unmeta
