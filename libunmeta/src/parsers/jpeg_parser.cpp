//
// Created by Giuseppe Francione on 06/02/26.
//

#include "../../include/jpeg_parser.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_reader.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/jpeg_segments.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Owns a decompress/compress pair so both are destroyed on every path.
 */
struct JpegTranscoder {
    jpeg_decompress_struct src{};
    jpeg_compress_struct dst{};
    JpegErrorMgr src_err{};
    JpegErrorMgr dst_err{};
    bool src_created = false;
    bool dst_created = false;

    JpegTranscoder() {
        // error handlers must be set before any possible error
        src.err = jpeg_std_error(&src_err.pub);
        src_err.pub.error_exit = jpeg_error_exit_throw;
        dst.err = jpeg_std_error(&dst_err.pub);
        dst_err.pub.error_exit = jpeg_error_exit_throw;

        jpeg_create_decompress(&src);
        src_created = true;
        jpeg_create_compress(&dst);
        dst_created = true;
    }

    ~JpegTranscoder() {
        if (dst_created) jpeg_destroy_compress(&dst);
        if (src_created) jpeg_destroy_decompress(&src);
    }

    JpegTranscoder(const JpegTranscoder&) = delete;
    JpegTranscoder& operator=(const JpegTranscoder&) = delete;
};

bool starts_with(const std::span<const unsigned char> payload, const std::string_view prefix) {
    return payload.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), payload.begin(),
                      [](const char a, const unsigned char b) { return static_cast<unsigned char>(a) == b; });
}

/**
 * @brief What a header segment carries, as far as metadata is concerned.
 */
struct SegmentKind {
    std::string key;      ///< Name reported by get_meta()
    bool listed = false;  ///< True if the key is in JpegParser::kMetaList
};

/**
 * @brief Classifies a segment; std::nullopt means it is needed to decode the image.
 */
std::optional<SegmentKind> classify(const unmeta::JpegSegment& seg) {
    using namespace std::string_view_literals;
    const auto p = seg.payload;

    if (seg.marker == unmeta::kJpegCom) return SegmentKind{"Comment", true};
    if (seg.marker < unmeta::kJpegApp0 || seg.marker > unmeta::kJpegApp0 + 15) return std::nullopt;

    const int n = seg.marker - unmeta::kJpegApp0;
    switch (n) {
        case 0:
            if (starts_with(p, "JFIF\0"sv) || starts_with(p, "JFXX\0"sv)) return std::nullopt;
            break;
        case 1:
            if (unmeta::exif::has_exif_prefix(p)) return SegmentKind{"Exif", true};
            if (starts_with(p, "http://ns.adobe.com/xap/1.0/\0"sv) ||
                starts_with(p, "http://ns.adobe.com/xmp/extension/\0"sv)) return SegmentKind{"XMP", true};
            break;
        case 2:
            if (starts_with(p, "ICC_PROFILE\0"sv)) return std::nullopt;
            if (starts_with(p, "FPXR\0"sv)) return SegmentKind{"FlashPix", true};
            break;
        case 12:
            return SegmentKind{starts_with(p, "Ducky"sv) ? "Ducky" : "PictureInfo", true};
        case 13:
            return SegmentKind{"Photoshop", true};
        case 14:
            if (starts_with(p, "Adobe"sv)) return std::nullopt;
            break;
        default:
            break;
    }
    return SegmentKind{"APP" + std::to_string(n), false};
}

std::string segment_text(const std::span<const unsigned char> payload, const size_t skip = 0) {
    std::string s(payload.begin() + static_cast<std::ptrdiff_t>(std::min(skip, payload.size())), payload.end());
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return s;
}

std::vector<unsigned char> read_input(const std::filesystem::path& path) {
    try {
        return unmeta::read_file_bytes(path);
    } catch (const std::runtime_error& e) {
        throw unmeta::CleaningError(e.what());
    }
}

} // namespace

namespace unmeta {

JpegParser::JpegParser(const std::filesystem::path& filename) : Parser(filename) {
    unique_FILE in(open_file(this->filename(), "rb"));
    if (!in) {
        throw InvalidInputError("Cannot open JPEG input: " + this->filename().string());
    }
    unsigned char soi[2] = {};
    if (std::fread(soi, 1, sizeof(soi), in.get()) != sizeof(soi) || soi[0] != 0xFF || soi[1] != 0xD8) {
        throw InvalidInputError("Not a JPEG file: " + this->filename().string());
    }
}

JpegParser::~JpegParser() {
    finalize();
}

MetaMap JpegParser::get_meta() const {
    const auto bytes = read_input(filename());
    const auto layout = parse_jpeg_segments(bytes);

    MetaMap meta;
    for (const auto& seg : layout.segments) {
        const auto kind = classify(seg);
        if (!kind) continue;

        if (kind->key == "Comment") {
            add_meta(meta, kind->key, segment_text(seg.payload));
        } else if (kind->key == "Exif") {
            try {
                add_meta(meta, kind->key, exif::read_tiff(seg.payload.subspan(6)));
            } catch (const CleaningError& e) {
                Logger::log(LogLevel::Warning, "Unreadable EXIF in " + filename().string() + ": " + e.what(),
                            "jpeg_parser");
                add_meta(meta, kind->key, "invalid");
            }
        } else if (kind->key == "XMP") {
            // the namespace identifier is NUL terminated
            const auto nul = std::find(seg.payload.begin(), seg.payload.end(), 0);
            add_meta(meta, kind->key, segment_text(seg.payload,
                     static_cast<size_t>(nul - seg.payload.begin()) + 1));
        } else {
            add_meta(meta, kind->key, std::to_string(seg.payload.size()) + " bytes");
        }
    }
    Logger::log(LogLevel::Debug, "Read " + std::to_string(meta.size()) + " metadata fields from " +
                filename().string(), "jpeg_parser");
    return meta;
}

bool JpegParser::remove_all_lightweight() {
    const auto bytes = read_input(filename());
    const auto layout = parse_jpeg_segments(bytes);

    std::vector<unsigned char> out = {0xFF, 0xD8};
    out.reserve(bytes.size());
    size_t dropped = 0;
    for (const auto& seg : layout.segments) {
        const auto kind = classify(seg);
        if (kind && kind->listed) {
            ++dropped;
            continue;
        }
        out.insert(out.end(),
                   bytes.begin() + static_cast<std::ptrdiff_t>(seg.offset),
                   bytes.begin() + static_cast<std::ptrdiff_t>(seg.offset + seg.size));
    }
    out.insert(out.end(), bytes.begin() + static_cast<std::ptrdiff_t>(layout.scan_offset), bytes.end());

    Logger::log(LogLevel::Debug, "Dropped " + std::to_string(dropped) + " segments from " +
                filename().string(), "jpeg_parser");
    try {
        write_file_bytes(output_filename(), out);
    } catch (const std::runtime_error& e) {
        throw CleaningError(e.what());
    }
    return true;
}

bool JpegParser::remove_all_thorough() {
    const auto& input = filename();
    const auto& output = output_filename();

    try {
        unique_FILE infile(open_file(input, "rb"));
        if (!infile) {
            throw std::runtime_error("Cannot open JPEG input: " + input.string());
        }
        unique_FILE outfile(open_file(output, "wb"));
        if (!outfile) {
            throw std::runtime_error("Cannot open JPEG output: " + output.string());
        }

        JpegTranscoder t;
        jpeg_stdio_src(&t.src, infile.get());
        // no jpeg_save_markers(): APPn and COM segments are discarded while reading

        if (jpeg_read_header(&t.src, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        Logger::log(LogLevel::Debug,
                    std::string("JPEG ") + (t.src.progressive_mode ? "progressive" : "baseline"),
                    "jpeg_parser");

        jvirt_barray_ptr *coef_arrays = jpeg_read_coefficients(&t.src);
        jpeg_copy_critical_parameters(&t.src, &t.dst);

        if (t.src.progressive_mode) {
            jpeg_simple_progression(&t.dst);
        }

        t.dst.optimize_coding = TRUE;
        jpeg_stdio_dest(&t.dst, outfile.get());
        jpeg_write_coefficients(&t.dst, coef_arrays);

        jpeg_finish_compress(&t.dst);
        jpeg_finish_decompress(&t.src);

        if (std::fclose(outfile.release()) != 0) {
            throw std::runtime_error("Cannot flush JPEG output: " + output.string());
        }
    } catch (const std::exception& e) {
        throw CleaningError("JPEG transcoding of " + input.string() + " failed: " + e.what());
    }

    Logger::log(LogLevel::Info, "JPEG transcoding completed: " + output.string(), "jpeg_parser");
    return true;
}

} // namespace unmeta
