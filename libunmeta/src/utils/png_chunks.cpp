//
// Created by Giuseppe Francione on 03/02/26.
//

#include "../../include/png_chunks.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cstdint>
#include <zlib.h>

namespace unmeta {

namespace {

    uint32_t read_be32(const unsigned char* p) {
        return (static_cast<uint32_t>(p[0]) << 24) |
               (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8)  |
               static_cast<uint32_t>(p[3]);
    }

    void append_be32(std::vector<unsigned char>& out, const uint32_t v) {
        out.push_back(static_cast<unsigned char>(v >> 24));
        out.push_back(static_cast<unsigned char>(v >> 16));
        out.push_back(static_cast<unsigned char>(v >> 8));
        out.push_back(static_cast<unsigned char>(v));
    }

    bool is_valid_chunk_type(const unsigned char* p) {
        return std::all_of(p, p + 4, [](const unsigned char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        });
    }

} // namespace

bool has_png_signature(const std::span<const unsigned char> bytes) noexcept {
    return bytes.size() >= kPngSignature.size() &&
           std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin());
}

std::vector<PngChunk> parse_png_chunks(const std::span<const unsigned char> bytes) {
    if (!has_png_signature(bytes)) {
        throw CleaningError("Missing PNG signature");
    }

    std::vector<PngChunk> chunks;
    size_t pos = kPngSignature.size();
    while (true) {
        if (bytes.size() - pos < 12) {
            throw CleaningError("Truncated PNG chunk at offset " + std::to_string(pos));
        }
        const uint32_t length = read_be32(&bytes[pos]);
        const unsigned char* type = &bytes[pos + 4];
        if (!is_valid_chunk_type(type)) {
            throw CleaningError("Invalid PNG chunk type at offset " + std::to_string(pos));
        }
        if (length > 0x7FFFFFFFu || bytes.size() - pos - 12 < length) {
            throw CleaningError("PNG chunk overruns the file at offset " + std::to_string(pos));
        }

        const unsigned char* data = type + 4;
        const uint32_t stored_crc = read_be32(data + length);
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type, 4 + length);
        if (static_cast<uint32_t>(crc) != stored_crc) {
            throw CleaningError("CRC mismatch in PNG chunk " + std::string(type, type + 4));
        }

        PngChunk& chunk = chunks.emplace_back();
        chunk.type.assign(type, type + 4);
        chunk.data.assign(data, data + length);
        pos += 12 + length;

        if (chunk.type == "IEND") {
            break;
        }
    }

    if (chunks.front().type != "IHDR") {
        throw CleaningError("PNG stream does not start with IHDR");
    }
    return chunks;
}

std::vector<unsigned char> serialize_png_chunks(const std::vector<PngChunk>& chunks) {
    std::vector<unsigned char> out(kPngSignature.begin(), kPngSignature.end());
    for (const auto& chunk : chunks) {
        append_be32(out, static_cast<uint32_t>(chunk.data.size()));
        const size_t type_pos = out.size();
        out.insert(out.end(), chunk.type.begin(), chunk.type.end());
        out.insert(out.end(), chunk.data.begin(), chunk.data.end());
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, &out[type_pos], static_cast<uInt>(4 + chunk.data.size()));
        append_be32(out, static_cast<uint32_t>(crc));
    }
    return out;
}

std::string inflate_zlib(const std::span<const unsigned char> data, const size_t max_size) {
    std::string out;
    out.resize(std::min<size_t>(std::max<size_t>(data.size() * 4, 256), max_size));

    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    if (inflateInit(&strm) != Z_OK) {
        throw CleaningError("inflateInit failed");
    }

    int ret;
    do {
        if (strm.total_out >= out.size()) {
            if (out.size() >= max_size) {
                inflateEnd(&strm);
                throw CleaningError("Compressed text chunk exceeds " + std::to_string(max_size) + " bytes");
            }
            out.resize(std::min(out.size() * 2, max_size));
        }
        strm.next_out = reinterpret_cast<Bytef*>(out.data()) + strm.total_out;
        strm.avail_out = static_cast<uInt>(out.size() - strm.total_out);

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            (ret == Z_BUF_ERROR && strm.avail_in == 0)) {
            inflateEnd(&strm);
            throw CleaningError("Corrupt compressed text chunk");
        }
    } while (ret != Z_STREAM_END);

    const size_t out_size = strm.total_out;
    inflateEnd(&strm);
    out.resize(out_size);
    return out;
}

} // namespace unmeta
